/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/bitfields_sanitizer.hpp"

#include <algorithm>

#include <boost/assert.hpp>

namespace parasieve::parachain {

  namespace {
    bool intersects(const std::vector<bool> &lhs,
                    const std::vector<bool> &rhs) {
      const auto size = std::min(lhs.size(), rhs.size());
      for (size_t i = 0; i < size; ++i) {
        if (lhs[i] and rhs[i]) {
          return true;
        }
      }
      return false;
    }
  }  // namespace

  BitfieldsSanitizer::BitfieldsSanitizer(
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider)
      : sr25519_provider_{std::move(sr25519_provider)},
        logger_{log::createLogger("BitfieldsSanitizer", "paras_inherent")} {
    BOOST_ASSERT(sr25519_provider_);
  }

  std::vector<SignedBitfield> BitfieldsSanitizer::sanitize(
      std::vector<SignedBitfield> unchecked,
      const DisputedBitfield &disputed,
      size_t expected_bits,
      const SigningContext &signing_context,
      const std::vector<ValidatorId> &validators) const {
    std::vector<SignedBitfield> checked;
    checked.reserve(unchecked.size());

    if (disputed.bits.size() != expected_bits) {
      SL_ERROR(logger_,
               "Disputed bitfield length {} does not match the number of "
               "availability cores {}",
               disputed.bits.size(),
               expected_bits);
      return checked;
    }

    std::optional<ValidatorIndex> last_index;
    for (auto &bitfield : unchecked) {
      const auto &bits = getPayload(bitfield).bits;
      const auto index = bitfield.payload.ix;

      if (bits.size() != expected_bits) {
        SL_TRACE(logger_,
                 "Bitfield of validator {} has {} bits, expected {}",
                 index,
                 bits.size(),
                 expected_bits);
        continue;
      }

      if (intersects(bits, disputed.bits)) {
        SL_TRACE(logger_,
                 "Bitfield of validator {} votes for a disputed core",
                 index);
        continue;
      }

      if (last_index and *last_index >= index) {
        SL_TRACE(logger_,
                 "Bitfield of validator {} is out of order, previous {}",
                 index,
                 *last_index);
        continue;
      }

      if (index >= validators.size()) {
        SL_TRACE(logger_,
                 "Bitfield of validator {} is out of the validator set of {}",
                 index,
                 validators.size());
        continue;
      }

      if (verify(bitfield, signing_context, validators[index])) {
        checked.emplace_back(std::move(bitfield));
      } else {
        SL_WARN(logger_,
                "Bitfield of validator {} has an invalid signature",
                index);
      }
      last_index = index;
    }

    return checked;
  }

  bool BitfieldsSanitizer::verify(const SignedBitfield &bitfield,
                                  const SigningContext &signing_context,
                                  const ValidatorId &validator) const {
    auto message = signing_context.signable(getPayload(bitfield));
    if (not message) {
      SL_WARN(logger_,
              "Can't encode bitfield of validator {}: {}",
              bitfield.payload.ix,
              message.error().message());
      return false;
    }
    auto res = sr25519_provider_->verify(
        bitfield.signature, message.value(), validator);
    if (res.has_error()) {
      SL_WARN(logger_,
              "Can't verify bitfield of validator {}: {}",
              bitfield.payload.ix,
              res.error().message());
      return false;
    }
    return res.value();
  }

}  // namespace parasieve::parachain
