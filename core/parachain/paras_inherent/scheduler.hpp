/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "parachain/types.hpp"

namespace parasieve::parachain {

  /// Why an availability core was freed
  enum class FreedReason : uint8_t {
    /// The candidate on the core became available or was disputed
    CONCLUDED,
    /// The candidate did not become available in time
    TIMED_OUT,
  };

  /**
   * Assignment of paras and backing groups to availability cores
   */
  class Scheduler {
   public:
    virtual ~Scheduler() = default;

    /// Number of availability cores, the expected length of bitfields
    virtual size_t availabilityCores() const = 0;

    /// Cores with a para scheduled on them, in core order
    virtual std::vector<std::pair<CoreIndex, ParachainId>> scheduledParas()
        const = 0;

    virtual void freeCoresAndFillClaimQueue(
        const std::map<CoreIndex, FreedReason> &freed, BlockNumber now) = 0;

    /// Whether occupied cores should be checked for availability timeouts
    virtual bool availabilityTimeoutCheckRequired() const = 0;

    /// Backing group assigned to `core` at block `at`
    virtual std::optional<GroupIndex> groupAssignedToCore(
        CoreIndex core, BlockNumber at) const = 0;

    virtual std::optional<std::vector<ValidatorIndex>> groupValidators(
        GroupIndex group) const = 0;

    /// Marks cores as occupied by the backed candidates of the paras
    virtual void occupied(
        const std::vector<std::pair<CoreIndex, ParachainId>> &now_occupied) = 0;
  };

}  // namespace parasieve::parachain
