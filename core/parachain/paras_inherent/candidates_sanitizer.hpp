/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <set>
#include <vector>

#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "parachain/paras_inherent/allowed_relay_parents.hpp"
#include "parachain/paras_inherent/configuration.hpp"
#include "parachain/paras_inherent/inclusion.hpp"
#include "parachain/paras_inherent/scheduler.hpp"
#include "parachain/types.hpp"

namespace parasieve::parachain {

  /// Reasons a backed candidate does not extend the chain of its para
  enum class CandidateCheckError {
    DISALLOWED_RELAY_PARENT = 1,
    VALIDATION_DATA_HASH_MISMATCH,
    UNSCHEDULED_CANDIDATE,
    INVALID_VALIDATION_CODE_HASH,
    PARA_HEAD_MISMATCH,
  };

  /// Scheduled cores of each para
  using ScheduledCores = std::map<ParachainId, std::set<CoreIndex>>;

  /**
   * Truncates the candidates of each para before the first one not matching
   * `pred`, then removes paras left without candidates.
   * `pred` is called as `pred(para_id, candidate)` in chain order and is not
   * called for candidates after the first mismatch.
   */
  template <typename C, typename Pred>
  void retainCandidates(std::map<ParachainId, std::vector<C>> &per_para,
                        Pred &&pred) {
    for (auto &[para_id, candidates] : per_para) {
      size_t valid = 0;
      while (valid < candidates.size() and pred(para_id, candidates[valid])) {
        ++valid;
      }
      candidates.erase(candidates.begin() + valid, candidates.end());
    }
    std::erase_if(per_para,
                  [](const auto &entry) { return entry.second.empty(); });
  }

  template <typename C>
  size_t countCandidates(
      const std::map<ParachainId, std::vector<C>> &per_para) {
    size_t count = 0;
    for (const auto &entry : per_para) {
      count += entry.second.size();
    }
    return count;
  }

  /**
   * Reduces the backed candidates of an inherent to chains of candidates
   * built on the latest head of their para, not disputed, and assigned to
   * the cores scheduled for the para.
   */
  class CandidatesSanitizer {
   public:
    using CandidatesPerPara =
        std::map<ParachainId, std::vector<BackedCandidate>>;

    CandidatesSanitizer(std::shared_ptr<crypto::Hasher> hasher,
                        std::shared_ptr<Inclusion> inclusion,
                        std::shared_ptr<Scheduler> scheduler);

    /**
     * Groups `candidates` per para, keeping their order, and drops
     * candidates (with the rest of their para's chain) which do not extend
     * the chain of the para, were concluded invalid or can't be assigned to
     * a scheduled core.
     */
    BackedCandidatesWithCore sanitize(
        std::vector<BackedCandidate> candidates,
        const AllowedRelayParentsTracker &allowed_relay_parents,
        const std::set<CandidateHash> &concluded_invalid_with_descendants,
        ScheduledCores scheduled,
        const HostConfiguration &config) const;

    /**
     * Keeps the candidates of each para forming a chain from the latest head
     * data of the para. Duplicates, candidates with a relay parent out of the
     * allowed window and candidates failing validation data, code or head
     * checks break the chain.
     */
    void filterUnchainedCandidates(
        CandidatesPerPara &candidates,
        const AllowedRelayParentsTracker &allowed_relay_parents,
        uint32_t max_pov_size) const;

    /// Removes concluded invalid candidates with their descendants
    void filterConcludedInvalid(
        CandidatesPerPara &candidates,
        const std::set<CandidateHash> &concluded_invalid_with_descendants)
        const;

    /**
     * With a single scheduled core and without elastic scaling the first
     * candidate of the para takes the core. With elastic scaling every
     * candidate must carry one of the para's scheduled cores.
     */
    BackedCandidatesWithCore mapCandidatesToCores(
        CandidatesPerPara candidates,
        const AllowedRelayParentsTracker &allowed_relay_parents,
        ScheduledCores scheduled,
        bool core_index_enabled) const;

    /// Core index injected into the candidate, if it is consistent with the
    /// size of the backing group assigned to that core
    std::optional<CoreIndex> injectedCoreIndex(
        const BackedCandidate &candidate,
        const AllowedRelayParentsTracker &allowed_relay_parents) const;

    /**
     * Checks that the candidate may be built on `parent_head`: its relay
     * parent is allowed and not older than the para's most recent context,
     * its validation data, validation code and para head hashes match.
     */
    outcome::result<void> verifyBackedCandidate(
        const BackedCandidate &candidate,
        const AllowedRelayParentsTracker &allowed_relay_parents,
        const HeadData &parent_head,
        uint32_t max_pov_size) const;

   private:
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<Inclusion> inclusion_;
    std::shared_ptr<Scheduler> scheduler_;
    log::Logger logger_;
  };

}  // namespace parasieve::parachain

OUTCOME_HPP_DECLARE_ERROR(parasieve::parachain, CandidateCheckError)
