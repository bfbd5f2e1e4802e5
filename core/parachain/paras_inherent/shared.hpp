/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>
#include <vector>

#include "parachain/paras_inherent/allowed_relay_parents.hpp"
#include "parachain/types.hpp"

namespace parasieve::parachain {

  /**
   * Session state shared between the parachain modules
   */
  class Shared {
   public:
    virtual ~Shared() = default;

    virtual SessionIndex sessionIndex() const = 0;

    virtual std::vector<ValidatorId> activeValidatorKeys() const = 0;

    /// Indices of the active validators disabled in the current session
    virtual std::set<ValidatorIndex> disabledValidators() const = 0;

    /// Updates the window of allowed relay parents, see
    /// `AllowedRelayParentsTracker::update`
    virtual void addAllowedRelayParent(
        const primitives::BlockHash &relay_parent,
        const primitives::StateRoot &state_root,
        BlockNumber number,
        uint32_t max_ancestry_len) = 0;

    virtual const AllowedRelayParentsTracker &allowedRelayParents() const = 0;
  };

}  // namespace parasieve::parachain
