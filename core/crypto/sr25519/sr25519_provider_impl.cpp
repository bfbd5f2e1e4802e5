/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sr25519/sr25519_provider_impl.hpp"

namespace parasieve::crypto {

  outcome::result<bool> Sr25519ProviderImpl::verify(
      const Sr25519Signature &signature,
      std::span<const uint8_t> message,
      const Sr25519PublicKey &public_key) const {
    bool result = sr25519_verify(
        signature.data(), message.data(), message.size(), public_key.data());
    return outcome::success(result);
  }

}  // namespace parasieve::crypto

OUTCOME_CPP_DEFINE_CATEGORY(parasieve::crypto, Sr25519ProviderError, e) {
  using parasieve::crypto::Sr25519ProviderError;
  switch (e) {
    case Sr25519ProviderError::VERIFY_UNKNOWN_ERROR:
      return "Internal error during sr25519 signature verification";
  }
  return "unknown Sr25519ProviderError";
}
