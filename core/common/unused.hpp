/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>

#include <scale/scale.hpp>

#include "common/outcome_throw.hpp"

namespace parasieve {

  enum class UnusedError : uint8_t {
    AttemptToEncodeUnused = 1,
    AttemptToDecodeUnused,
  };

  /// Special zero-size-type for some things
  ///  (e.g., dummy types of variant, unsupported or experimental).
  template <size_t N>
  struct Unused {
    bool operator==(const Unused &) const = default;
  };

  /// To raise failure while attempt to encode unused entity
  template <size_t N>
  [[noreturn]] ::scale::ScaleEncoderStream &operator<<(
      ::scale::ScaleEncoderStream &, const Unused<N> &) {
    common::raise(UnusedError::AttemptToEncodeUnused);
  }

  /// To raise failure while attempt to decode unused entity
  template <size_t N>
  [[noreturn]] ::scale::ScaleDecoderStream &operator>>(
      ::scale::ScaleDecoderStream &, Unused<N> &) {
    common::raise(UnusedError::AttemptToDecodeUnused);
  }

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &s, const Unused<N> &) {
    return s << "<unused>";
  }

}  // namespace parasieve

OUTCOME_HPP_DECLARE_ERROR(parasieve, UnusedError);
