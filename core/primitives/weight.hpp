/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

#include <fmt/format.h>

#include "primitives/math.hpp"

namespace parasieve::primitives {

  /**
   * Two-dimensional weight. All arithmetic saturates, comparisons are
   * per-dimension.
   */
  struct Weight {
    /// The weight of computational time used based on some reference hardware.
    uint64_t ref_time = 0;
    /// The weight of storage space used by proof of validity.
    uint64_t proof_size = 0;

    static constexpr Weight zero() {
      return {};
    }

    constexpr Weight saturatingAdd(const Weight &other) const {
      return {math::sat_add_unsigned(ref_time, other.ref_time),
              math::sat_add_unsigned(proof_size, other.proof_size)};
    }

    constexpr Weight saturatingSub(const Weight &other) const {
      return {math::sat_sub_unsigned(ref_time, other.ref_time),
              math::sat_sub_unsigned(proof_size, other.proof_size)};
    }

    /// `nullopt` when either dimension would underflow
    constexpr std::optional<Weight> checkedSub(const Weight &other) const {
      auto ref = math::checked_sub(ref_time, other.ref_time);
      auto proof = math::checked_sub(proof_size, other.proof_size);
      if (not ref or not proof) {
        return std::nullopt;
      }
      return Weight{*ref, *proof};
    }

    /// True if any dimension of this weight exceeds the other
    constexpr bool anyGt(const Weight &other) const {
      return ref_time > other.ref_time or proof_size > other.proof_size;
    }

    constexpr bool allLte(const Weight &other) const {
      return ref_time <= other.ref_time and proof_size <= other.proof_size;
    }

    constexpr bool allGte(const Weight &other) const {
      return ref_time >= other.ref_time and proof_size >= other.proof_size;
    }

    Weight &operator+=(const Weight &other) {
      *this = saturatingAdd(other);
      return *this;
    }

    constexpr bool operator==(const Weight &) const = default;
  };

  inline std::ostream &operator<<(std::ostream &os, const Weight &w) {
    return os << "Weight(ref_time: " << w.ref_time
              << ", proof_size: " << w.proof_size << ")";
  }

}  // namespace parasieve::primitives

template <>
struct fmt::formatter<parasieve::primitives::Weight> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const parasieve::primitives::Weight &w, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "(ref_time: {}, proof_size: {})",
                          w.ref_time,
                          w.proof_size);
  }
};
