/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "dispute_coordinator/types.hpp"
#include "parachain/paras_inherent/weight_info.hpp"
#include "parachain/types.hpp"
#include "primitives/weight.hpp"

namespace parasieve::parachain {

  using primitives::Weight;

  Weight signedBitfieldWeight(const WeightInfo &info,
                              const SignedBitfield &bitfield);

  Weight signedBitfieldsWeight(const WeightInfo &info,
                               std::span<const SignedBitfield> bitfields);

  /// Candidates with a new validation code are weighed as code upgrades,
  /// others by the number of their validity votes.
  Weight backedCandidateWeight(const WeightInfo &info,
                               const BackedCandidate &candidate);

  Weight backedCandidatesWeight(const WeightInfo &info,
                                std::span<const BackedCandidate> candidates);

  Weight disputeStatementSetWeight(const WeightInfo &info,
                                   const dispute::DisputeStatementSet &set);

  Weight multiDisputeStatementSetsWeight(
      const WeightInfo &info,
      std::span<const dispute::DisputeStatementSet> disputes);

  Weight checkedMultiDisputeStatementSetsWeight(
      const WeightInfo &info,
      std::span<const dispute::CheckedDisputeStatementSet> disputes);

  /// Sum of the weights of every element of the inherent
  Weight parasInherentTotalWeight(
      const WeightInfo &info,
      std::span<const BackedCandidate> candidates,
      std::span<const SignedBitfield> bitfields,
      std::span<const dispute::DisputeStatementSet> disputes);

}  // namespace parasieve::parachain
