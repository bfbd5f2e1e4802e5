/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>
#include <vector>

#include <boost/functional/hash.hpp>
#include <fmt/format.h>
#include <scale/scale.hpp>

#include "common/buffer_view.hpp"

namespace parasieve::common {

  /**
   * Owning byte sequence. Encoded as a SCALE byte collection.
   */
  class Buffer : public std::vector<uint8_t> {
    using Base = std::vector<uint8_t>;

   public:
    Buffer() = default;
    Buffer(std::initializer_list<uint8_t> b) : Base(b) {}
    explicit Buffer(Base v) : Base(std::move(v)) {}
    explicit Buffer(BufferView view) : Base(view.begin(), view.end()) {}
    Buffer(size_t size, uint8_t byte) : Base(size, byte) {}

    template <typename It>
    Buffer(It begin, It end) : Base(begin, end) {}

    BufferView view() const {
      return BufferView{data(), size()};
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator BufferView() const {
      return view();
    }

    Buffer &put(BufferView view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    std::string toHex() const {
      return hex_lower(view());
    }

    bool operator==(const Buffer &other) const {
      return static_cast<const Base &>(*this)
          == static_cast<const Base &>(other);
    }

    auto operator<=>(const Buffer &other) const {
      return view() <=> other.view();
    }

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Buffer &buffer) {
      return s << static_cast<const Base &>(buffer);
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Buffer &buffer) {
      return s >> static_cast<Base &>(buffer);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << buffer.toHex();
  }

}  // namespace parasieve::common

template <>
struct std::hash<parasieve::common::Buffer> {
  size_t operator()(const parasieve::common::Buffer &x) const {
    return boost::hash_range(x.begin(), x.end());
  }
};

template <>
struct fmt::formatter<parasieve::common::Buffer>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const parasieve::common::Buffer &buffer,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "0x{}", buffer.toHex());
  }
};
