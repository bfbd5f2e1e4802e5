/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_provider.hpp"

namespace parasieve::crypto {

  class Sr25519ProviderImpl : public Sr25519Provider {
   public:
    outcome::result<bool> verify(
        const Sr25519Signature &signature,
        std::span<const uint8_t> message,
        const Sr25519PublicKey &public_key) const override;
  };

}  // namespace parasieve::crypto
