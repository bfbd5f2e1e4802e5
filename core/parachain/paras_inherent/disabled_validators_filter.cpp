/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/disabled_validators_filter.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "parachain/paras_inherent/candidates_sanitizer.hpp"

namespace parasieve::parachain {

  DisabledValidatorsFilter::DisabledValidatorsFilter(
      std::shared_ptr<Scheduler> scheduler)
      : scheduler_{std::move(scheduler)},
        logger_{log::createLogger("DisabledValidatorsFilter",
                                  "paras_inherent")} {
    BOOST_ASSERT(scheduler_);
  }

  void DisabledValidatorsFilter::filter(
      BackedCandidatesWithCore &candidates,
      const std::set<ValidatorIndex> &disabled,
      const AllowedRelayParentsTracker &allowed_relay_parents,
      bool core_index_enabled,
      uint32_t minimum_backing_votes) const {
    if (disabled.empty()) {
      return;
    }

    retainCandidates(
        candidates,
        [&](ParachainId para_id,
            std::pair<BackedCandidate, CoreIndex> &candidate_with_core) {
          auto &[candidate, core_index] = candidate_with_core;
          if (filterCandidate(candidate,
                              core_index,
                              disabled,
                              allowed_relay_parents,
                              core_index_enabled,
                              minimum_backing_votes)) {
            return true;
          }
          SL_DEBUG(logger_,
                   "Dropping candidate of para {} on core {}",
                   para_id,
                   core_index);
          return false;
        });
  }

  bool DisabledValidatorsFilter::filterCandidate(
      BackedCandidate &candidate,
      CoreIndex core_index,
      const std::set<ValidatorIndex> &disabled,
      const AllowedRelayParentsTracker &allowed_relay_parents,
      bool core_index_enabled,
      uint32_t minimum_backing_votes) const {
    auto [validator_indices, injected_core_index] =
        candidate.validatorIndicesAndCoreIndex(core_index_enabled);

    // the group is the one assigned to the core at the block following the
    // relay parent
    auto info = allowed_relay_parents.acquireInfo(candidate.relayParent(),
                                                  std::nullopt);
    if (not info) {
      SL_DEBUG(logger_,
               "Relay parent {} of candidate is not allowed",
               candidate.relayParent());
      return false;
    }

    auto group = scheduler_->groupAssignedToCore(core_index, info->second + 1);
    if (not group) {
      SL_DEBUG(logger_, "Can't get the group assigned to core {}", core_index);
      return false;
    }

    auto validators = scheduler_->groupValidators(*group);
    if (not validators) {
      SL_DEBUG(logger_, "Can't get the validators of group {}", *group);
      return false;
    }

    // positions in the group bitmap of the votes to remove
    std::vector<size_t> to_drop;
    for (size_t i = 0; i < validators->size(); ++i) {
      if (disabled.contains((*validators)[i]) and i < validator_indices.size()
          and validator_indices[i]) {
        to_drop.push_back(i);
      }
    }
    // bits past the group size are not votes of the group
    if (validator_indices.size() > validators->size()) {
      std::fill(validator_indices.begin() + validators->size(),
                validator_indices.end(),
                false);
    }

    // validity votes are ordered as the set bits of the bitmap
    auto &votes = candidate.validity_votes;
    for (auto it = to_drop.rbegin(); it != to_drop.rend(); ++it) {
      const auto rank = std::count(validator_indices.begin(),
                                   validator_indices.begin() + *it,
                                   true);
      if (static_cast<size_t>(rank) < votes.size()) {
        votes.erase(votes.begin() + rank);
      }
    }
    for (auto i : to_drop) {
      validator_indices[i] = false;
    }
    candidate.setValidatorIndicesAndCoreIndex(std::move(validator_indices),
                                              injected_core_index);

    const auto required =
        effectiveMinimumBackingVotes(validators->size(), minimum_backing_votes);
    if (votes.size() < required) {
      SL_DEBUG(logger_,
               "Candidate has {} backing votes left, {} required",
               votes.size(),
               required);
      return false;
    }
    return true;
  }

}  // namespace parasieve::parachain
