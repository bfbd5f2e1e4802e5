/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>

#include "parachain/types.hpp"
#include "primitives/weight.hpp"

namespace parasieve::parachain {

  /// Parameters of the host that affect the parachains inherent
  struct HostConfiguration {
    /// Number of validity votes a candidate needs, capped by its group size
    uint32_t minimum_backing_votes = 2;
    /// Blocks after a dispute concluded during which it is still accepted
    BlockNumber dispute_post_conclusion_acceptance_period = 0;
    /// How many ancestors of the current block may be used as relay parents
    uint32_t allowed_ancestry_len = 0;
    uint32_t max_pov_size = 0;
    /// Candidates carry an injected core index and a para may occupy
    /// several cores
    bool elastic_scaling_enabled = false;
  };

  struct BlockWeights {
    primitives::Weight max_block;
    /// `max_total` of the mandatory dispatch class
    std::optional<primitives::Weight> mandatory_max_total;
  };

  struct BlockLength {
    /// Maximum block length of the mandatory dispatch class
    uint32_t mandatory_max = 0;
  };

  /**
   * Source of the host configuration and block limits
   */
  class Configuration {
   public:
    virtual ~Configuration() = default;

    virtual HostConfiguration activeConfig() const = 0;

    virtual BlockWeights blockWeights() const = 0;

    virtual BlockLength blockLength() const = 0;
  };

  /// Weight limit of the inherent: mandatory `max_total` (or `max_block` if
  /// unset) and the mandatory block length as proof size
  primitives::Weight maxBlockWeight(const Configuration &configuration);

}  // namespace parasieve::parachain
