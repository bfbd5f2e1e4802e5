/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/tie.hpp>

#include "dispute_coordinator/types.hpp"
#include "parachain/types.hpp"
#include "primitives/block_header.hpp"
#include "primitives/inherent_data.hpp"

namespace parasieve::parachain {

  /// Identifier of the parachains inherent in `InherentData`
  inline const primitives::InherentIdentifier kParachainsInherentIdentifier{
      {'p', 'a', 'r', 'a', 'c', 'h', 'n', '0'}};

  struct ParachainInherentData {
    SCALE_TIE(4);

    /// The array of signed bitfields by validators claiming the candidate is
    /// available (or not).
    /// @note The array must be sorted by validator index corresponding to the
    /// authority set
    std::vector<SignedBitfield> bitfields;

    /// The array of backed candidates for inclusion in the current block
    std::vector<BackedCandidate> backed_candidates;

    /// Sets of dispute votes for inclusion,
    dispute::MultiDisputeStatementSet disputes;

    /// The header of the parent block, checked against the actual parent
    primitives::BlockHeader parent_header;
  };

}  // namespace parasieve::parachain
