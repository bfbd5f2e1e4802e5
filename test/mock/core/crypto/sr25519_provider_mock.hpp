/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_provider.hpp"

#include <gmock/gmock.h>

namespace parasieve::crypto {

  class Sr25519ProviderMock : public Sr25519Provider {
   public:
    MOCK_METHOD(outcome::result<bool>,
                verify,
                (const Sr25519Signature &,
                 std::span<const uint8_t>,
                 const Sr25519PublicKey &),
                (const, override));
  };

}  // namespace parasieve::crypto
