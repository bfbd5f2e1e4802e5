/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>

#include <scale/scale.hpp>

namespace parasieve {

  /// Special zero-size-type for some things
  /// (e.g. unsupported, experimental or empty).
  struct Empty {
    bool operator==(const Empty &) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Empty &) {
    return s;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Empty &) {
    return s;
  }

  // auxiliary definition for gtest
  inline std::ostream &operator<<(std::ostream &s, const Empty &) {
    return s;
  }

}  // namespace parasieve
