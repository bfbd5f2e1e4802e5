/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "crypto/chacha.hpp"
#include "log/logger.hpp"
#include "parachain/paras_inherent/bitfields_sanitizer.hpp"
#include "parachain/paras_inherent/weight_info.hpp"
#include "parachain/types.hpp"
#include "primitives/weight.hpp"

namespace parasieve::parachain {

  /**
   * Randomly picks items while their accumulated weight fits `limit`.
   * Items at `preferred` indices are tried first, both groups in shuffled
   * order; items that do not fit are skipped.
   * @return the weight of the picked items and their indices in ascending
   * order
   */
  template <typename T, typename F>
  std::pair<primitives::Weight, std::vector<size_t>> randomSel(
      crypto::RandChaCha20 &rng,
      std::span<const T> items,
      std::vector<size_t> preferred,
      const F &weight_of,
      const primitives::Weight &limit) {
    if (items.empty()) {
      return {primitives::Weight::zero(), {}};
    }

    std::vector<size_t> rest;
    for (size_t i = 0; i < items.size(); ++i) {
      if (std::find(preferred.begin(), preferred.end(), i) == preferred.end()) {
        rest.push_back(i);
      }
    }

    auto acc = primitives::Weight::zero();
    std::vector<size_t> picked;
    picked.reserve(items.size());

    auto pick = [&](size_t index) {
      // preferred indices come from the caller
      if (index >= items.size()) {
        return;
      }
      const auto updated = acc.saturatingAdd(weight_of(items[index]));
      if (updated.anyGt(limit)) {
        return;
      }
      acc = updated;
      picked.push_back(index);
    };

    rng.shuffle(preferred);
    for (auto index : preferred) {
      pick(index);
    }
    rng.shuffle(rest);
    for (auto index : rest) {
      pick(index);
    }

    std::sort(picked.begin(), picked.end());
    return {acc, std::move(picked)};
  }

  /// Bitfield of `expected_bits` with the bits of `freed_cores` set,
  /// cores out of range are ignored
  DisputedBitfield createDisputedBitfield(
      size_t expected_bits, const std::vector<CoreIndex> &freed_cores);

  /**
   * Selection of bitfields and candidates fitting the weight of a block.
   */
  class WeightLimiter {
   public:
    explicit WeightLimiter(const WeightInfo &weight_info);

    /**
     * Seed of the selection: the parent block randomness if there is one,
     * the parent hash otherwise.
     */
    crypto::RandChaCha20::Seed computeEntropy(
        const primitives::BlockHash &parent_hash,
        const std::optional<common::Hash256> &parent_randomness) const;

    /**
     * Limits `candidates` and `bitfields` to `max_consumable_weight`.
     * Everything is kept if it fits. Otherwise all bitfields are kept if
     * they fit and a random subset of the candidate chains (runs of
     * candidates of the same para) fills the rest, preferring chains with a
     * code upgrade. If the bitfields alone do not fit, candidates are
     * dropped and a random subset of bitfields is kept.
     * @return the weight of what is kept
     */
    primitives::Weight applyWeightLimit(
        std::vector<BackedCandidate> &candidates,
        std::vector<SignedBitfield> &bitfields,
        const primitives::Weight &max_consumable_weight,
        crypto::RandChaCha20 &rng) const;

   private:
    const WeightInfo &weight_info_;
    log::Logger logger_;
  };

}  // namespace parasieve::parachain
