/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include "common/blob.hpp"
#include "common/buffer.hpp"

inline parasieve::common::Hash256 operator""_hash256(const char *c, size_t s) {
  parasieve::common::Hash256 hash{};
  std::copy_n(c, std::min(s, size_t{32}), hash.rbegin());
  return hash;
}

inline parasieve::common::Buffer operator""_buf(const char *c, size_t s) {
  return parasieve::common::Buffer(c, c + s);
}

/// Hash with `n` in its first byte, the rest zero
inline parasieve::common::Hash256 fromNumber(uint8_t n) {
  parasieve::common::Hash256 hash{};
  hash[0] = n;
  return hash;
}
