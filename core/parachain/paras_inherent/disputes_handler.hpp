/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "dispute_coordinator/types.hpp"
#include "outcome/outcome.hpp"

namespace parasieve::parachain {

  /**
   * On-chain dispute bookkeeping
   */
  class DisputesHandler {
   public:
    virtual ~DisputesHandler() = default;

    /// Checks signatures and relevance of the set
    /// @return nullopt if the set must not be imported
    virtual std::optional<dispute::CheckedDisputeStatementSet>
    filterDisputeData(const dispute::DisputeStatementSet &set,
                      BlockNumber post_conclusion_acceptance_period) const = 0;

    virtual outcome::result<void> processCheckedMultiDisputeData(
        const dispute::CheckedMultiDisputeStatementSet &disputes) = 0;

    /// No parachain blocks are included while the relay chain is frozen
    virtual bool isFrozen() const = 0;

    virtual bool concludedInvalid(SessionIndex session,
                                  const CandidateHash &candidate) const = 0;

    virtual void noteIncluded(SessionIndex session,
                              const CandidateHash &candidate,
                              BlockNumber included_in) = 0;
  };

}  // namespace parasieve::parachain
