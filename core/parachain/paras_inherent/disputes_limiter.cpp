/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/disputes_limiter.hpp"

#include <set>

#include "parachain/paras_inherent/weights.hpp"

namespace parasieve::parachain {

  DisputesLimiter::DisputesLimiter(const WeightInfo &weight_info)
      : weight_info_{weight_info},
        logger_{log::createLogger("DisputesLimiter", "paras_inherent")} {}

  bool DisputesLimiter::deduplicate(
      dispute::MultiDisputeStatementSet &disputes) const {
    std::set<std::pair<SessionIndex, CandidateHash>> seen;
    const auto size_before = disputes.size();
    std::erase_if(disputes, [&](const dispute::DisputeStatementSet &set) {
      return not seen.emplace(set.session, set.candidate_hash).second;
    });
    return disputes.size() != size_before;
  }

  LimitedDisputes DisputesLimiter::limitAndSanitizeDisputes(
      dispute::MultiDisputeStatementSet disputes,
      const DisputeSetFilter &filter,
      const primitives::Weight &max_consumable_weight) const {
    if (deduplicate(disputes)) {
      SL_DEBUG(logger_, "Found duplicate statement sets, retaining the first");
    }

    LimitedDisputes result;
    const auto disputes_weight =
        multiDisputeStatementSetsWeight(weight_info_, disputes);

    if (disputes_weight.anyGt(max_consumable_weight)) {
      SL_DEBUG(logger_,
               "Disputes weight {} exceeds the limit {}, dropping some",
               disputes_weight,
               max_consumable_weight);

      for (const auto &set : disputes) {
        const auto set_weight = disputeStatementSetWeight(weight_info_, set);
        const auto updated = result.weight.saturatingAdd(set_weight);
        if (not max_consumable_weight.allGte(updated)) {
          SL_TRACE(logger_,
                   "Dispute statement set for candidate {} does not fit, "
                   "dropping it with the rest",
                   set.candidate_hash);
          break;
        }
        // charged even if the set does not pass the check
        result.weight = updated;
        if (auto checked = filter(set)) {
          result.checked.emplace_back(std::move(*checked));
        } else {
          SL_TRACE(logger_,
                   "Dispute statement set for candidate {} is invalid",
                   set.candidate_hash);
        }
      }
      return result;
    }

    for (const auto &set : disputes) {
      if (auto checked = filter(set)) {
        result.checked.emplace_back(std::move(*checked));
      } else {
        SL_TRACE(logger_,
                 "Dispute statement set for candidate {} is invalid",
                 set.candidate_hash);
      }
    }
    result.weight =
        checkedMultiDisputeStatementSetsWeight(weight_info_, result.checked);
    return result;
  }

}  // namespace parasieve::parachain
