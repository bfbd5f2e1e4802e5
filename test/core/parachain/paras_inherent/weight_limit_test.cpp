/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/weight_limit.hpp"

#include <gtest/gtest.h>

#include "core/parachain/paras_inherent/paras_inherent_test_harness.hpp"
#include "parachain/paras_inherent/weights.hpp"

using namespace parasieve::parachain;
using parasieve::crypto::RandChaCha20;
using parasieve::primitives::Weight;

class WeightLimitTest : public ParasInherentTestHarness {
 protected:
  BackedCandidate candidate(ParachainId para, uint8_t n) const {
    return makeCandidate(para,
                         fromNumber(10),
                         10,
                         HeadData{n},
                         HeadData{static_cast<uint8_t>(n + 1)});
  }

  static std::vector<SignedBitfield> bitfields(size_t count) {
    std::vector<SignedBitfield> result;
    for (size_t i = 0; i < count; ++i) {
      result.push_back(makeBitfield(static_cast<ValidatorIndex>(i),
                                    {true, false}));
    }
    return result;
  }

  static constexpr uint64_t kCandidateRefTime =
      TestWeightInfo::kCandidate + 2 * TestWeightInfo::kVote;

  TestWeightInfo weight_info;
  WeightLimiter limiter{weight_info};
  RandChaCha20 rng{RandChaCha20::Seed{}};
};

/**
 * @given candidates and bitfields fitting into the limit
 * @when applying the weight limit
 * @then nothing is removed and the full weight is returned
 */
TEST_F(WeightLimitTest, UnderLimitKeepsEverything) {
  std::vector<BackedCandidate> candidates{candidate(1, 0), candidate(2, 0)};
  auto signed_bitfields = bitfields(3);
  const auto expected =
      backedCandidatesWeight(weight_info, candidates)
          .saturatingAdd(signedBitfieldsWeight(weight_info, signed_bitfields));

  auto weight = limiter.applyWeightLimit(
      candidates, signed_bitfields, {10000, kUnlimitedProofSize}, rng);

  EXPECT_EQ(weight, expected);
  EXPECT_EQ(candidates.size(), 2);
  EXPECT_EQ(signed_bitfields.size(), 3);
}

/**
 * @given chains of three paras, one of them upgrading its code
 * @when only the upgrade and one more candidate fit
 * @then the upgrade chain is preferred and whole chains are kept in order
 */
TEST_F(WeightLimitTest, PrefersCodeUpgradesAndKeepsWholeChains) {
  auto a1 = candidate(1, 0);
  auto a2 = candidate(1, 1);
  auto b = candidate(2, 0);
  auto c = candidate(3, 0);
  c.candidate.commitments.opt_para_runtime = "code"_buf;
  std::vector<BackedCandidate> candidates{a1, a2, b, c};
  auto signed_bitfields = bitfields(2);

  const uint64_t limit = 2 * TestWeightInfo::kBitfield
                       + TestWeightInfo::kCodeUpgrade + kCandidateRefTime;
  auto weight = limiter.applyWeightLimit(
      candidates, signed_bitfields, {limit, kUnlimitedProofSize}, rng);

  ASSERT_EQ(candidates.size(), 2);
  EXPECT_EQ(hash(candidates[0]), hash(b));
  EXPECT_EQ(hash(candidates[1]), hash(c));
  EXPECT_EQ(signed_bitfields.size(), 2);
  EXPECT_EQ(weight.ref_time, limit);
  EXPECT_TRUE(weight.allLte({limit, kUnlimitedProofSize}));
}

/**
 * @given chain heavier than the space left after bitfields
 * @when applying the weight limit
 * @then the chain is dropped as a whole
 */
TEST_F(WeightLimitTest, DropsChainNotFittingAsWhole) {
  std::vector<BackedCandidate> candidates{candidate(1, 0), candidate(1, 1)};
  auto signed_bitfields = bitfields(1);

  const uint64_t limit = TestWeightInfo::kBitfield + kCandidateRefTime;
  auto weight = limiter.applyWeightLimit(
      candidates, signed_bitfields, {limit, kUnlimitedProofSize}, rng);

  EXPECT_TRUE(candidates.empty());
  EXPECT_EQ(signed_bitfields.size(), 1);
  EXPECT_EQ(weight, signedBitfieldsWeight(weight_info, signed_bitfields));
}

/**
 * @given bitfields alone exceeding the limit
 * @when applying the weight limit
 * @then all candidates are dropped and a subset of bitfields is kept in order
 */
TEST_F(WeightLimitTest, SelectsBitfieldsWhenTheyDoNotFit) {
  std::vector<BackedCandidate> candidates{candidate(1, 0)};
  auto signed_bitfields = bitfields(5);

  const uint64_t limit = 2 * TestWeightInfo::kBitfield + 5;
  auto weight = limiter.applyWeightLimit(
      candidates, signed_bitfields, {limit, kUnlimitedProofSize}, rng);

  EXPECT_TRUE(candidates.empty());
  ASSERT_EQ(signed_bitfields.size(), 2);
  EXPECT_LT(signed_bitfields[0].payload.ix, signed_bitfields[1].payload.ix);
  EXPECT_EQ(weight, signedBitfieldsWeight(weight_info, signed_bitfields));
}

/**
 * @given the same seed
 * @when selecting bitfields twice
 * @then the same subset is selected
 */
TEST_F(WeightLimitTest, SelectionIsDeterministicForSeed) {
  auto select = [&] {
    RandChaCha20 seeded{limiter.computeEntropy(fromNumber(7), std::nullopt)};
    std::vector<BackedCandidate> candidates;
    auto signed_bitfields = bitfields(10);
    limiter.applyWeightLimit(candidates,
                             signed_bitfields,
                             {3 * TestWeightInfo::kBitfield,
                              kUnlimitedProofSize},
                             seeded);
    std::vector<ValidatorIndex> indices;
    for (const auto &bitfield : signed_bitfields) {
      indices.push_back(bitfield.payload.ix);
    }
    return indices;
  };
  auto first = select();
  EXPECT_EQ(first.size(), 3);
  EXPECT_EQ(first, select());
}

/**
 * @given parent randomness or only the parent hash
 * @when computing the selection entropy
 * @then the randomness is used when present, otherwise the parent hash
 */
TEST_F(WeightLimitTest, EntropyComesFromRandomnessOrParentHash) {
  const auto parent_hash = fromNumber(1);
  const auto randomness = fromNumber(2);

  auto entropy = limiter.computeEntropy(parent_hash, randomness);
  EXPECT_TRUE(std::equal(entropy.begin(), entropy.end(), randomness.begin()));

  entropy = limiter.computeEntropy(parent_hash, std::nullopt);
  EXPECT_TRUE(std::equal(entropy.begin(), entropy.end(), parent_hash.begin()));
}

/**
 * @given freed cores, one of them out of range
 * @when creating the disputed bitfield
 * @then bits of the cores in range are set
 */
TEST_F(WeightLimitTest, DisputedBitfieldMarksFreedCores) {
  auto bitfield = createDisputedBitfield(4, {1, 3, 9});
  EXPECT_EQ(bitfield.bits, (std::vector<bool>{false, true, false, true}));
}
