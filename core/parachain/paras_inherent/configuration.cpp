/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/configuration.hpp"

namespace parasieve::parachain {

  primitives::Weight maxBlockWeight(const Configuration &configuration) {
    const auto weights = configuration.blockWeights();
    const auto length = configuration.blockLength();
    return primitives::Weight{
        .ref_time = weights.mandatory_max_total.value_or(weights.max_block)
                        .ref_time,
        .proof_size = length.mandatory_max,
    };
  }

}  // namespace parasieve::parachain
