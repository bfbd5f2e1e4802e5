/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/weight.hpp"

namespace parasieve::parachain {

  /**
   * Benchmarked weighing function of the parachains inherent.
   * Only `ref_time` of the returned weights is used, `proof_size` is
   * replaced by the encoded size of the weighed element.
   */
  class WeightInfo {
   public:
    virtual ~WeightInfo() = default;

    /// Weight of a single signed availability bitfield
    virtual primitives::Weight enterBitfields() const = 0;

    /// Weight of a backed candidate with `votes` validity votes
    virtual primitives::Weight enterBackedCandidatesVariable(
        uint32_t votes) const = 0;

    /// Weight of a backed candidate carrying a new validation code
    virtual primitives::Weight enterBackedCandidateCodeUpgrade() const = 0;

    /// Weight of a dispute statement set with `statements` statements
    virtual primitives::Weight enterVariableDisputes(
        uint32_t statements) const = 0;
  };

}  // namespace parasieve::parachain
