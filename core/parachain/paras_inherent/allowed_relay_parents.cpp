/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/allowed_relay_parents.hpp"

#include <algorithm>

namespace parasieve::parachain {

  void AllowedRelayParentsTracker::update(
      const primitives::BlockHash &relay_parent,
      const primitives::StateRoot &state_root,
      BlockNumber number,
      uint32_t max_ancestry_len) {
    // the most recent block is always allowed
    const size_t limit = size_t(max_ancestry_len) + 1;

    buffer_.push_back({relay_parent, state_root});
    latest_number_ = number;
    while (buffer_.size() > limit) {
      buffer_.pop_front();
    }
  }

  std::optional<std::pair<primitives::StateRoot, BlockNumber>>
  AllowedRelayParentsTracker::acquireInfo(
      const primitives::BlockHash &relay_parent,
      std::optional<BlockNumber> prev_context) const {
    auto it = std::find_if(
        buffer_.begin(), buffer_.end(), [&](const RelayParentInfo &info) {
          return info.relay_parent == relay_parent;
        });
    if (it == buffer_.end()) {
      return std::nullopt;
    }
    if (prev_context and *prev_context > latest_number_) {
      return std::nullopt;
    }

    const auto age = static_cast<BlockNumber>(std::distance(it, buffer_.end()))
                   - 1;
    const auto number = latest_number_ - age;
    if (prev_context and *prev_context > number) {
      return std::nullopt;
    }
    return std::make_pair(it->state_root, number);
  }

}  // namespace parasieve::parachain
