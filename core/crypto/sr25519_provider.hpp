/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "crypto/sr25519_types.hpp"
#include "outcome/outcome.hpp"

namespace parasieve::crypto {

  /**
   * sr25519 provider error codes
   */
  enum class Sr25519ProviderError {
    VERIFY_UNKNOWN_ERROR = 1  // unknown error occured during call to `verify`
                              // method of bound function
  };

  class Sr25519Provider {
   public:
    virtual ~Sr25519Provider() = default;

    /**
     * Verifies that \param message was derived using \param public_key on
     * \param signature
     */
    virtual outcome::result<bool> verify(
        const Sr25519Signature &signature,
        std::span<const uint8_t> message,
        const Sr25519PublicKey &public_key) const = 0;
  };
}  // namespace parasieve::crypto

OUTCOME_HPP_DECLARE_ERROR(parasieve::crypto, Sr25519ProviderError)
