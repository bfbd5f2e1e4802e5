/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "common/outcome_throw.hpp"
#include "outcome/outcome.hpp"

namespace parasieve::primitives {
  /**
   * @brief inherent data encode/decode error codes
   */
  enum class InherentDataError {
    IDENTIFIER_ALREADY_EXISTS = 1,
    IDENTIFIER_DOES_NOT_EXIST
  };
}  // namespace parasieve::primitives

OUTCOME_HPP_DECLARE_ERROR(parasieve::primitives, InherentDataError);

namespace parasieve::primitives {
  using InherentIdentifier = common::Blob<8u>;

  /**
   * Inherent data to include in a block
   */
  struct InherentData {
    /** Put data for an inherent into the internal storage.
     *
     * @arg identifier need to be unique, otherwise decoding of these
     * values will not work!
     * @arg inherent encoded data to be stored
     * @returns success if the data could be inserted an no data for an inherent
     * with the same
     */
    template <typename T>
    outcome::result<void> putData(InherentIdentifier identifier,
                                  const T &inherent) {
      auto [it, inserted] =
          data.try_emplace(std::move(identifier), common::Buffer());
      if (inserted) {
        OUTCOME_TRY(encoded, ::scale::encode(inherent));
        it->second = common::Buffer(std::move(encoded));
        return outcome::success();
      }
      return InherentDataError::IDENTIFIER_ALREADY_EXISTS;
    }

    /** Replace the data for an inherent.
     * If it does not exist, the data is just inserted.
     */
    template <typename T>
    outcome::result<void> replaceData(InherentIdentifier identifier,
                                      const T &inherent) {
      OUTCOME_TRY(encoded, ::scale::encode(inherent));
      data[identifier] = common::Buffer(std::move(encoded));
      return outcome::success();
    }

    /**
     * @returns the data for the requested inherent.
     */
    template <typename T>
    outcome::result<T> getData(const InherentIdentifier &identifier) const {
      auto inherent = data.find(identifier);
      if (inherent != data.end()) {
        return ::scale::decode<T>(inherent->second);
      }
      return InherentDataError::IDENTIFIER_DOES_NOT_EXIST;
    }

    bool operator==(const InherentData &rhs) const = default;

    std::map<InherentIdentifier, common::Buffer> data;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const InherentData &v) {
    std::vector<std::pair<InherentIdentifier, common::Buffer>> vec;
    vec.reserve(v.data.size());
    for (auto &pair : v.data) {
      vec.emplace_back(pair);
    }
    return s << vec;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, InherentData &v) {
    std::vector<std::pair<InherentIdentifier, common::Buffer>> vec;
    s >> vec;

    for (const auto &item : vec) {
      // throw if identifier already exists
      if (v.data.contains(item.first)) {
        common::raise(InherentDataError::IDENTIFIER_ALREADY_EXISTS);
      }
      v.data.insert(item);
    }

    return s;
  }
}  // namespace parasieve::primitives
