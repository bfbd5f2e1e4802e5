/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "parachain/types.hpp"

using namespace parasieve::parachain;

class BackedCandidateTest : public testing::Test {
 protected:
  static BackedCandidate withBitmap(std::vector<bool> bits) {
    BackedCandidate candidate{};
    candidate.validator_indices.bits = std::move(bits);
    return candidate;
  }
};

/**
 * @given validator bitmap
 * @when injecting a core index
 * @then 8 bits of the index are appended LSB first
 */
TEST_F(BackedCandidateTest, InjectCoreIndex) {
  auto candidate = withBitmap({true, false});
  candidate.injectCoreIndex(5);
  EXPECT_EQ(candidate.validator_indices.bits,
            (std::vector<bool>{
                true, false, true, false, true, false, false, false, false,
                false}));
}

/**
 * @given bitmap with an injected core index
 * @when splitting it with core indices enabled and disabled
 * @then the core index is extracted only when enabled
 */
TEST_F(BackedCandidateTest, SplitValidatorIndicesAndCoreIndex) {
  auto candidate = withBitmap({true, true, false});
  candidate.injectCoreIndex(200);

  auto [bits, core_index] = candidate.validatorIndicesAndCoreIndex(true);
  EXPECT_EQ(bits, (std::vector<bool>{true, true, false}));
  EXPECT_EQ(core_index, 200);

  auto [raw_bits, no_core] = candidate.validatorIndicesAndCoreIndex(false);
  EXPECT_EQ(raw_bits.size(), 11);
  EXPECT_FALSE(no_core);
}

/**
 * @given bitmap not longer than a core index
 * @when splitting it
 * @then there is no core index
 */
TEST_F(BackedCandidateTest, ShortBitmapHasNoCoreIndex) {
  auto candidate = withBitmap(std::vector<bool>(8, true));
  auto [bits, core_index] = candidate.validatorIndicesAndCoreIndex(true);
  EXPECT_EQ(bits.size(), 8);
  EXPECT_FALSE(core_index);
}

/**
 * @given candidate with an injected core index
 * @when replacing its validator indices
 * @then the core index is re-injected after them
 */
TEST_F(BackedCandidateTest, SetValidatorIndicesKeepsCoreIndex) {
  auto candidate = BackedCandidate::from(
      {}, {}, scale::BitVec{std::vector<bool>{true, true}}, CoreIndex{3});
  candidate.setValidatorIndicesAndCoreIndex({true, false}, CoreIndex{3});

  auto [bits, core_index] = candidate.validatorIndicesAndCoreIndex(true);
  EXPECT_EQ(bits, (std::vector<bool>{true, false}));
  EXPECT_EQ(core_index, 3);
}

/**
 * @given committed receipt
 * @when hashing it and its plain form
 * @then both hashes are equal
 */
TEST_F(BackedCandidateTest, CandidateHashOfPlainReceipt) {
  parasieve::crypto::HasherImpl hasher;
  CommittedCandidateReceipt receipt{};
  receipt.descriptor.para_id = 7;
  receipt.commitments.para_head = parasieve::common::Buffer{1, 2, 3};

  const auto plain = toPlain(hasher, receipt);
  EXPECT_EQ(plain.commitments_hash,
            hasher.blake2b_256(scale::encode(receipt.commitments).value()));
  EXPECT_EQ(candidateHash(hasher, receipt), candidateHash(hasher, plain));
}

/**
 * @given backing group sizes smaller and larger than the configured minimum
 * @when computing the effective minimum of votes
 * @then it never exceeds the group size
 */
TEST_F(BackedCandidateTest, EffectiveMinimumBackingVotes) {
  EXPECT_EQ(effectiveMinimumBackingVotes(1, 2), 1);
  EXPECT_EQ(effectiveMinimumBackingVotes(5, 2), 2);
}
