/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sr25519/sr25519_provider_impl.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace parasieve::crypto;

class Sr25519ProviderTest : public testing::Test {
 protected:
  void SetUp() override {
    std::array<uint8_t, SR25519_SEED_SIZE> seed{};
    seed.fill(7);
    std::array<uint8_t, SR25519_KEYPAIR_SIZE> keypair{};
    sr25519_keypair_from_seed(keypair.data(), seed.data());
    std::copy_n(keypair.begin(), SR25519_SECRET_SIZE, secret.begin());
    std::copy_n(keypair.begin() + SR25519_SECRET_SIZE,
                SR25519_PUBLIC_SIZE,
                public_key.begin());
  }

  Sr25519Signature sign(std::span<const uint8_t> message) const {
    Sr25519Signature signature;
    sr25519_sign(signature.data(),
                 public_key.data(),
                 secret.data(),
                 message.data(),
                 message.size());
    return signature;
  }

  Sr25519ProviderImpl provider;
  std::array<uint8_t, SR25519_SECRET_SIZE> secret{};
  Sr25519PublicKey public_key;
  std::vector<uint8_t> message{1, 2, 3, 4, 5};
};

/**
 * @given message signed with a keypair
 * @when verifying the signature with its public key
 * @then the signature is valid
 */
TEST_F(Sr25519ProviderTest, VerifiesOwnSignature) {
  EXPECT_OUTCOME_TRUE(valid,
                      provider.verify(sign(message), message, public_key));
  EXPECT_TRUE(valid);
}

/**
 * @given signature of a different message
 * @when verifying it
 * @then the signature is invalid
 */
TEST_F(Sr25519ProviderTest, RejectsSignatureOfOtherMessage) {
  auto signature = sign(message);
  message.back() ^= 1;
  EXPECT_OUTCOME_TRUE(valid, provider.verify(signature, message, public_key));
  EXPECT_FALSE(valid);
}
