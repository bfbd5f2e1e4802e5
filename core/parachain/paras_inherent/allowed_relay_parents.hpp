/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <optional>
#include <utility>

#include "parachain/types.hpp"
#include "primitives/common.hpp"

namespace parasieve::parachain {

  /**
   * Window of the most recent relay chain blocks which candidates may use
   * as their relay parent. The oldest block is at the front, the block with
   * `latestNumber()` at the back.
   */
  class AllowedRelayParentsTracker {
   public:
    struct RelayParentInfo {
      primitives::BlockHash relay_parent;
      primitives::StateRoot state_root;
    };

    /**
     * Appends a block to the window and drops the oldest ones, so that at
     * most `max_ancestry_len + 1` blocks remain.
     */
    void update(const primitives::BlockHash &relay_parent,
                const primitives::StateRoot &state_root,
                BlockNumber number,
                uint32_t max_ancestry_len);

    /**
     * Finds the state root and block number of `relay_parent`.
     * @param prev_context the relay parent number of the previous candidate
     * of the same para, the acquired block must not be older than it
     * @return nullopt if the block is not in the window or is older than
     * `prev_context`
     */
    std::optional<std::pair<primitives::StateRoot, BlockNumber>> acquireInfo(
        const primitives::BlockHash &relay_parent,
        std::optional<BlockNumber> prev_context) const;

    BlockNumber latestNumber() const {
      return latest_number_;
    }

    size_t size() const {
      return buffer_.size();
    }

   private:
    std::deque<RelayParentInfo> buffer_;
    BlockNumber latest_number_ = 0;
  };

}  // namespace parasieve::parachain
