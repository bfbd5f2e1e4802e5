/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/candidates_sanitizer.hpp"

#include <iterator>

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(parasieve::parachain, CandidateCheckError, e) {
  using E = parasieve::parachain::CandidateCheckError;
  switch (e) {
    case E::DISALLOWED_RELAY_PARENT:
      return "Relay parent is not in the allowed window";
    case E::VALIDATION_DATA_HASH_MISMATCH:
      return "Persisted validation data hash mismatch";
    case E::UNSCHEDULED_CANDIDATE:
      return "Para has no current validation code";
    case E::INVALID_VALIDATION_CODE_HASH:
      return "Validation code hash mismatch";
    case E::PARA_HEAD_MISMATCH:
      return "Para head hash mismatch";
  }
  return "Unknown CandidateCheckError";
}

namespace parasieve::parachain {

  CandidatesSanitizer::CandidatesSanitizer(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<Inclusion> inclusion,
      std::shared_ptr<Scheduler> scheduler)
      : hasher_{std::move(hasher)},
        inclusion_{std::move(inclusion)},
        scheduler_{std::move(scheduler)},
        logger_{log::createLogger("CandidatesSanitizer", "paras_inherent")} {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(inclusion_);
    BOOST_ASSERT(scheduler_);
  }

  BackedCandidatesWithCore CandidatesSanitizer::sanitize(
      std::vector<BackedCandidate> candidates,
      const AllowedRelayParentsTracker &allowed_relay_parents,
      const std::set<CandidateHash> &concluded_invalid_with_descendants,
      ScheduledCores scheduled,
      const HostConfiguration &config) const {
    CandidatesPerPara per_para;
    for (auto &candidate : candidates) {
      per_para[candidate.paraId()].emplace_back(std::move(candidate));
    }

    filterUnchainedCandidates(
        per_para, allowed_relay_parents, config.max_pov_size);

    filterConcludedInvalid(per_para, concluded_invalid_with_descendants);

    return mapCandidatesToCores(std::move(per_para),
                                allowed_relay_parents,
                                std::move(scheduled),
                                config.elastic_scaling_enabled);
  }

  void CandidatesSanitizer::filterUnchainedCandidates(
      CandidatesPerPara &candidates,
      const AllowedRelayParentsTracker &allowed_relay_parents,
      uint32_t max_pov_size) const {
    std::map<ParachainId, HeadData> latest_head_data;
    for (const auto &entry : candidates) {
      const auto para_id = entry.first;
      auto head = inclusion_->paraLatestHeadData(para_id);
      if (not head) {
        SL_DEBUG(logger_, "Latest head data for para {} is unknown", para_id);
        continue;
      }
      latest_head_data.emplace(para_id, std::move(*head));
    }

    std::map<ParachainId, std::set<CandidateHash>> visited;

    retainCandidates(
        candidates,
        [&](ParachainId para_id, const BackedCandidate &candidate) {
          auto head_it = latest_head_data.find(para_id);
          if (head_it == latest_head_data.end()) {
            return false;
          }

          const auto candidate_hash =
              candidateHash(*hasher_, candidate.candidate);
          if (not visited[para_id].emplace(candidate_hash).second) {
            SL_DEBUG(logger_,
                     "Found duplicate candidate {} of para {}, dropping",
                     candidate_hash,
                     para_id);
            return false;
          }

          auto res = verifyBackedCandidate(
              candidate, allowed_relay_parents, head_it->second, max_pov_size);
          if (res.has_error()) {
            SL_DEBUG(logger_,
                     "Verification of candidate {} of para {} failed: {}",
                     candidate_hash,
                     para_id,
                     res.error().message());
            return false;
          }

          head_it->second = candidate.candidate.commitments.para_head;
          return true;
        });
  }

  void CandidatesSanitizer::filterConcludedInvalid(
      CandidatesPerPara &candidates,
      const std::set<CandidateHash> &concluded_invalid_with_descendants)
      const {
    retainCandidates(
        candidates,
        [&](ParachainId para_id, const BackedCandidate &candidate) {
          const auto candidate_hash =
              candidateHash(*hasher_, candidate.candidate);
          if (concluded_invalid_with_descendants.contains(candidate_hash)) {
            SL_DEBUG(logger_,
                     "Candidate {} of para {} was concluded invalid or is a "
                     "descendant of a concluded invalid candidate",
                     candidate_hash,
                     para_id);
            return false;
          }
          return true;
        });
  }

  BackedCandidatesWithCore CandidatesSanitizer::mapCandidatesToCores(
      CandidatesPerPara candidates,
      const AllowedRelayParentsTracker &allowed_relay_parents,
      ScheduledCores scheduled,
      bool core_index_enabled) const {
    BackedCandidatesWithCore with_core;

    for (auto &[para_id, backed] : candidates) {
      if (backed.empty()) {
        continue;
      }

      auto scheduled_it = scheduled.find(para_id);
      if (scheduled_it == scheduled.end() or scheduled_it->second.empty()) {
        SL_DEBUG(logger_,
                 "Para {} has no scheduled cores but {} candidates were "
                 "supplied",
                 para_id,
                 backed.size());
        continue;
      }
      auto &cores = scheduled_it->second;

      if (cores.size() == 1 and not core_index_enabled) {
        // candidates of a para are in chain order
        with_core[para_id].emplace_back(std::move(backed.front()),
                                        *cores.begin());
        continue;
      }

      if (not core_index_enabled) {
        SL_WARN(logger_,
                "Para {} has {} scheduled cores but elastic scaling is not "
                "enabled",
                para_id,
                cores.size());
        continue;
      }

      std::vector<std::pair<BackedCandidate, CoreIndex>> assigned;
      for (auto &candidate : backed) {
        if (cores.empty()) {
          SL_DEBUG(logger_, "Found enough candidates for para {}", para_id);
          break;
        }
        auto core_index =
            injectedCoreIndex(candidate, allowed_relay_parents);
        if (not core_index) {
          SL_DEBUG(logger_,
                   "Candidate of para {} has no valid injected core index, "
                   "while the para has multiple scheduled cores",
                   para_id);
          break;
        }
        if (cores.erase(*core_index) == 0) {
          SL_DEBUG(logger_,
                   "Candidate of para {} is injected with core {} which is "
                   "not scheduled for it",
                   para_id,
                   *core_index);
          break;
        }
        assigned.emplace_back(std::move(candidate), *core_index);
      }

      if (not assigned.empty()) {
        auto &entry = with_core[para_id];
        std::move(assigned.begin(), assigned.end(), std::back_inserter(entry));
      }
    }

    return with_core;
  }

  std::optional<CoreIndex> CandidatesSanitizer::injectedCoreIndex(
      const BackedCandidate &candidate,
      const AllowedRelayParentsTracker &allowed_relay_parents) const {
    // without the injected core index the bitmap must match the group size
    const auto [validator_indices, core_index] =
        candidate.validatorIndicesAndCoreIndex(true);
    if (not core_index) {
      return std::nullopt;
    }

    auto info = allowed_relay_parents.acquireInfo(candidate.relayParent(),
                                                  std::nullopt);
    if (not info) {
      SL_DEBUG(logger_,
               "Relay parent {} of candidate is not allowed",
               candidate.relayParent());
      return std::nullopt;
    }

    auto group = scheduler_->groupAssignedToCore(*core_index, info->second + 1);
    if (not group) {
      SL_DEBUG(logger_, "Can't get the group assigned to core {}", *core_index);
      return std::nullopt;
    }

    auto validators = scheduler_->groupValidators(*group);
    if (not validators) {
      return std::nullopt;
    }

    if (validators->size() != validator_indices.size()) {
      SL_DEBUG(logger_,
               "Backing group {} has {} validators, candidate bitmap has {}",
               *group,
               validators->size(),
               validator_indices.size());
      return std::nullopt;
    }
    return core_index;
  }

  outcome::result<void> CandidatesSanitizer::verifyBackedCandidate(
      const BackedCandidate &candidate,
      const AllowedRelayParentsTracker &allowed_relay_parents,
      const HeadData &parent_head,
      uint32_t max_pov_size) const {
    const auto &descriptor = candidate.candidate.descriptor;
    const auto &commitments = candidate.candidate.commitments;

    auto info = allowed_relay_parents.acquireInfo(
        descriptor.relay_parent,
        inclusion_->paraMostRecentContext(descriptor.para_id));
    if (not info) {
      return CandidateCheckError::DISALLOWED_RELAY_PARENT;
    }
    const auto &[state_root, relay_parent_number] = *info;

    const PersistedValidationData pvd{
        .parent_head = parent_head,
        .relay_parent_number = relay_parent_number,
        .relay_parent_storage_root = state_root,
        .max_pov_size = max_pov_size,
    };
    if (persistedValidationDataHash(*hasher_, pvd)
        != descriptor.persisted_data_hash) {
      return CandidateCheckError::VALIDATION_DATA_HASH_MISMATCH;
    }

    auto code_hash = inclusion_->currentCodeHash(descriptor.para_id);
    if (not code_hash) {
      return CandidateCheckError::UNSCHEDULED_CANDIDATE;
    }
    if (descriptor.validation_code_hash != *code_hash) {
      return CandidateCheckError::INVALID_VALIDATION_CODE_HASH;
    }

    if (descriptor.para_head_hash
        != hasher_->blake2b_256(commitments.para_head)) {
      return CandidateCheckError::PARA_HEAD_MISMATCH;
    }

    OUTCOME_TRY(inclusion_->checkValidationOutputs(
        descriptor.para_id, relay_parent_number, commitments));
    return outcome::success();
  }

}  // namespace parasieve::parachain
