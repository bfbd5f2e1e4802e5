/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/weights.hpp"

#include <scale/scale.hpp>

namespace parasieve::parachain {

  namespace {
    template <typename T>
    Weight withProofSizeOf(Weight weight, const T &element) {
      weight.proof_size = ::scale::encode(element).value().size();
      return weight;
    }

    template <typename T, typename F>
    Weight sumOf(std::span<const T> items, const F &weigh) {
      auto total = Weight::zero();
      for (const auto &item : items) {
        total += weigh(item);
      }
      return total;
    }
  }  // namespace

  Weight signedBitfieldWeight(const WeightInfo &info,
                              const SignedBitfield &bitfield) {
    return withProofSizeOf(info.enterBitfields(), bitfield);
  }

  Weight signedBitfieldsWeight(const WeightInfo &info,
                               std::span<const SignedBitfield> bitfields) {
    return sumOf(bitfields, [&](const SignedBitfield &bitfield) {
      return signedBitfieldWeight(info, bitfield);
    });
  }

  Weight backedCandidateWeight(const WeightInfo &info,
                               const BackedCandidate &candidate) {
    if (candidate.candidate.commitments.opt_para_runtime) {
      return withProofSizeOf(info.enterBackedCandidateCodeUpgrade(),
                             candidate);
    }
    return withProofSizeOf(
        info.enterBackedCandidatesVariable(
            static_cast<uint32_t>(candidate.validity_votes.size())),
        candidate);
  }

  Weight backedCandidatesWeight(const WeightInfo &info,
                                std::span<const BackedCandidate> candidates) {
    return sumOf(candidates, [&](const BackedCandidate &candidate) {
      return backedCandidateWeight(info, candidate);
    });
  }

  Weight disputeStatementSetWeight(const WeightInfo &info,
                                   const dispute::DisputeStatementSet &set) {
    return withProofSizeOf(
        info.enterVariableDisputes(
            static_cast<uint32_t>(set.statements.size())),
        set);
  }

  Weight multiDisputeStatementSetsWeight(
      const WeightInfo &info,
      std::span<const dispute::DisputeStatementSet> disputes) {
    return sumOf(disputes, [&](const dispute::DisputeStatementSet &set) {
      return disputeStatementSetWeight(info, set);
    });
  }

  Weight checkedMultiDisputeStatementSetsWeight(
      const WeightInfo &info,
      std::span<const dispute::CheckedDisputeStatementSet> disputes) {
    return sumOf(disputes,
                 [&](const dispute::CheckedDisputeStatementSet &checked) {
                   return disputeStatementSetWeight(info, checked.set);
                 });
  }

  Weight parasInherentTotalWeight(
      const WeightInfo &info,
      std::span<const BackedCandidate> candidates,
      std::span<const SignedBitfield> bitfields,
      std::span<const dispute::DisputeStatementSet> disputes) {
    return backedCandidatesWeight(info, candidates)
        .saturatingAdd(signedBitfieldsWeight(info, bitfields))
        .saturatingAdd(multiDisputeStatementSetsWeight(info, disputes));
  }

}  // namespace parasieve::parachain
