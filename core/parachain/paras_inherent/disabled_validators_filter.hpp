/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <set>

#include "log/logger.hpp"
#include "parachain/paras_inherent/allowed_relay_parents.hpp"
#include "parachain/paras_inherent/inclusion.hpp"
#include "parachain/paras_inherent/scheduler.hpp"

namespace parasieve::parachain {

  /**
   * Removes backing votes of disabled validators from candidates.
   */
  class DisabledValidatorsFilter {
   public:
    explicit DisabledValidatorsFilter(std::shared_ptr<Scheduler> scheduler);

    /**
     * Strips the votes of `disabled` validators. A candidate whose backing
     * group can't be resolved, or left with fewer than
     * `min(group size, minimum_backing_votes)` votes, is dropped together
     * with the rest of its para's chain.
     */
    void filter(BackedCandidatesWithCore &candidates,
                const std::set<ValidatorIndex> &disabled,
                const AllowedRelayParentsTracker &allowed_relay_parents,
                bool core_index_enabled,
                uint32_t minimum_backing_votes) const;

   private:
    bool filterCandidate(
        BackedCandidate &candidate,
        CoreIndex core_index,
        const std::set<ValidatorIndex> &disabled,
        const AllowedRelayParentsTracker &allowed_relay_parents,
        bool core_index_enabled,
        uint32_t minimum_backing_votes) const;

    std::shared_ptr<Scheduler> scheduler_;
    log::Logger logger_;
  };

}  // namespace parasieve::parachain
