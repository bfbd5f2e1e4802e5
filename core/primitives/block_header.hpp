/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/hasher.hpp"
#include "primitives/common.hpp"

namespace parasieve::primitives {

  /// Opaque chain-specific auxiliary data of a header
  using Digest = common::Buffer;

  /**
   * @struct BlockHeader represents header of a block
   */
  struct BlockHeader {
    BlockHash parent_hash{};            ///< Parent block hash
    BlockNumber number{};               ///< Block number (height)
    StateRoot state_root{};             ///< Merkle tree root of state
    common::Hash256 extrinsics_root{};  ///< Hash of included extrinsics
    Digest digest{};                    ///< Chain-specific auxiliary data

    bool operator==(const BlockHeader &rhs) const = default;
  };

  /**
   * @brief outputs object of type BlockHeader to stream
   * @note block number is compact-encoded
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockHeader &bh) {
    return s << bh.parent_hash << ::scale::CompactInteger(bh.number)
             << bh.state_root << bh.extrinsics_root << bh.digest;
  }

  /**
   * @brief decodes object of type BlockHeader from stream
   */
  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockHeader &bh) {
    ::scale::CompactInteger number_compact;
    s >> bh.parent_hash >> number_compact >> bh.state_root >> bh.extrinsics_root
        >> bh.digest;
    bh.number = number_compact.convert_to<BlockNumber>();
    return s;
  }

  /// Hash of the SCALE-encoded header
  BlockHash calculateBlockHash(const BlockHeader &header,
                               const crypto::Hasher &hasher);

}  // namespace parasieve::primitives
