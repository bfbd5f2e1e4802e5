/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/weight_limit.hpp"

#include <iterator>
#include <string_view>
#include <tuple>

#include <fmt/ranges.h>

#include "parachain/paras_inherent/weights.hpp"

namespace parasieve::parachain {

  namespace {
    constexpr std::string_view kCandidateSeedSubject =
        "candidate-seed-selection-subject";
    static_assert(kCandidateSeedSubject.size()
                  == std::tuple_size_v<crypto::RandChaCha20::Seed>);

    template <typename T>
    void retainIndices(std::vector<T> &items,
                       const std::vector<size_t> &sorted_indices) {
      std::vector<T> kept;
      kept.reserve(sorted_indices.size());
      for (auto index : sorted_indices) {
        kept.emplace_back(std::move(items[index]));
      }
      items = std::move(kept);
    }
  }  // namespace

  DisputedBitfield createDisputedBitfield(
      size_t expected_bits, const std::vector<CoreIndex> &freed_cores) {
    DisputedBitfield bitfield;
    bitfield.bits.assign(expected_bits, false);
    for (auto core : freed_cores) {
      if (core < expected_bits) {
        bitfield.bits[core] = true;
      }
    }
    return bitfield;
  }

  WeightLimiter::WeightLimiter(const WeightInfo &weight_info)
      : weight_info_{weight_info},
        logger_{log::createLogger("WeightLimiter", "paras_inherent")} {}

  crypto::RandChaCha20::Seed WeightLimiter::computeEntropy(
      const primitives::BlockHash &parent_hash,
      const std::optional<common::Hash256> &parent_randomness) const {
    crypto::RandChaCha20::Seed entropy;
    std::copy(kCandidateSeedSubject.begin(),
              kCandidateSeedSubject.end(),
              entropy.begin());
    if (parent_randomness) {
      std::copy(parent_randomness->begin(),
                parent_randomness->end(),
                entropy.begin());
    } else {
      SL_WARN(logger_, "Parent block randomness did not provide entropy");
      std::copy(parent_hash.begin(), parent_hash.end(), entropy.begin());
    }
    return entropy;
  }

  primitives::Weight WeightLimiter::applyWeightLimit(
      std::vector<BackedCandidate> &candidates,
      std::vector<SignedBitfield> &bitfields,
      const primitives::Weight &max_consumable_weight,
      crypto::RandChaCha20 &rng) const {
    const auto candidates_weight =
        backedCandidatesWeight(weight_info_, candidates);
    const auto bitfields_weight =
        signedBitfieldsWeight(weight_info_, bitfields);
    const auto total = bitfields_weight.saturatingAdd(candidates_weight);

    if (max_consumable_weight.allGte(total)) {
      return total;
    }

    // candidates of a para are supplied in chain order
    std::vector<std::vector<BackedCandidate>> chains;
    std::optional<ParachainId> current_para;
    for (auto &candidate : candidates) {
      if (current_para != candidate.paraId()) {
        current_para = candidate.paraId();
        chains.emplace_back();
      }
      chains.back().emplace_back(std::move(candidate));
    }
    candidates.clear();

    // candidates with a code upgrade are large and would hardly fit later
    std::vector<size_t> preferred;
    for (size_t i = 0; i < chains.size(); ++i) {
      if (std::any_of(chains[i].begin(),
                      chains[i].end(),
                      [](const BackedCandidate &candidate) {
                        return candidate.candidate.commitments.opt_para_runtime
                            .has_value();
                      })) {
        preferred.push_back(i);
      }
    }

    if (auto max_for_candidates =
            max_consumable_weight.checkedSub(bitfields_weight)) {
      auto [chains_weight, picked] = randomSel(
          rng,
          std::span<const std::vector<BackedCandidate>>(chains),
          std::move(preferred),
          [&](const std::vector<BackedCandidate> &chain) {
            return backedCandidatesWeight(weight_info_, chain);
          },
          *max_for_candidates);
      SL_DEBUG(logger_,
               "Picked candidate chains {} of {}",
               fmt::join(picked, ", "),
               chains.size());

      for (auto index : picked) {
        auto &chain = chains[index];
        std::move(chain.begin(), chain.end(), std::back_inserter(candidates));
      }
      return chains_weight.saturatingAdd(bitfields_weight);
    }

    // not even the bitfields fit, skip the candidates entirely
    auto [bitfields_picked_weight, picked] = randomSel(
        rng,
        std::span<const SignedBitfield>(bitfields),
        {},
        [&](const SignedBitfield &bitfield) {
          return signedBitfieldWeight(weight_info_, bitfield);
        },
        max_consumable_weight);
    SL_DEBUG(logger_,
             "Picked bitfields {} of {}",
             fmt::join(picked, ", "),
             bitfields.size());

    retainIndices(bitfields, picked);
    return bitfields_picked_weight;
  }

}  // namespace parasieve::parachain
