/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/block_header.hpp"

namespace parasieve::primitives {

  BlockHash calculateBlockHash(const BlockHeader &header,
                               const crypto::Hasher &hasher) {
    auto encoded = ::scale::encode(header).value();
    return hasher.blake2b_256(encoded);
  }

}  // namespace parasieve::primitives
