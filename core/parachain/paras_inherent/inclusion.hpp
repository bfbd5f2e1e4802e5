/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "outcome/outcome.hpp"
#include "parachain/paras_inherent/allowed_relay_parents.hpp"
#include "parachain/types.hpp"

namespace parasieve::parachain {

  /// Candidates of each para in chain order, with the core each is backed on
  using BackedCandidatesWithCore =
      std::map<ParachainId,
               std::vector<std::pair<BackedCandidate, CoreIndex>>>;

  /// Receipts of candidates with the votes of their backers
  using BackingValidatorsPerCandidate = std::vector<
      std::pair<CandidateReceipt,
                std::vector<std::pair<ValidatorIndex, ValidityAttestation>>>>;

  struct ProcessedCandidates {
    /// Cores occupied by the processed candidates
    std::vector<std::pair<CoreIndex, ParachainId>> core_indices;
    BackingValidatorsPerCandidate
        candidate_receipt_with_backing_validator_indices;
  };

  /**
   * Para heads and candidates pending availability
   */
  class Inclusion {
   public:
    virtual ~Inclusion() = default;

    /// Head data of the most recent candidate of the para, pending or
    /// included
    virtual std::optional<HeadData> paraLatestHeadData(
        ParachainId para) const = 0;

    virtual std::optional<ValidationCodeHash> currentCodeHash(
        ParachainId para) const = 0;

    /// Relay parent number of the most recent candidate of the para
    virtual std::optional<BlockNumber> paraMostRecentContext(
        ParachainId para) const = 0;

    /// Checks size limits of head data and new code, upward, horizontal and
    /// downward message limits and the horizontal watermark of `commitments`
    /// against the state of the para
    virtual outcome::result<void> checkValidationOutputs(
        ParachainId para,
        BlockNumber relay_parent_number,
        const CandidateCommitments &commitments) const = 0;

    /// Frees cores occupied by the candidates
    /// @return freed cores with the candidates that occupied them
    virtual std::vector<std::pair<CoreIndex, CandidateHash>> freeDisputed(
        const std::set<CandidateHash> &disputed) = 0;

    /// Records availability votes of `bitfields`
    /// @return cores whose candidates became available
    virtual std::vector<std::pair<CoreIndex, CandidateHash>>
    updatePendingAvailabilityAndGetFreedCores(
        const std::vector<ValidatorId> &validators,
        const std::vector<SignedBitfield> &bitfields) = 0;

    /// Frees cores whose candidates did not become available in time
    virtual std::vector<CoreIndex> freeTimedout() = 0;

    /// Makes the candidates pending availability on their cores
    virtual outcome::result<ProcessedCandidates> processCandidates(
        const AllowedRelayParentsTracker &allowed_relay_parents,
        const BackedCandidatesWithCore &candidates,
        bool core_index_enabled) = 0;
  };

}  // namespace parasieve::parachain
