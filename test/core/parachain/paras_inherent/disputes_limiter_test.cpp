/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/paras_inherent/disputes_limiter.hpp"

#include <gtest/gtest.h>

#include "core/parachain/paras_inherent/paras_inherent_test_harness.hpp"
#include "parachain/paras_inherent/weights.hpp"

using namespace parasieve::parachain;
using parasieve::dispute::CheckedDisputeStatementSet;
using parasieve::dispute::DisputeStatementSet;
using parasieve::dispute::MultiDisputeStatementSet;
using parasieve::primitives::Weight;

class DisputesLimiterTest : public ParasInherentTestHarness {
 protected:
  static DisputeStatementSet makeSet(uint8_t candidate,
                                     SessionIndex session,
                                     size_t statements = 2) {
    DisputeStatementSet set{
        .candidate_hash = fromNumber(candidate),
        .session = session,
        .statements = {},
    };
    for (size_t i = 0; i < statements; ++i) {
      set.statements.emplace_back(
          parasieve::dispute::ValidDisputeStatement{
              parasieve::dispute::Explicit{}},
          static_cast<ValidatorIndex>(i),
          ValidatorSignature{});
    }
    return set;
  }

  static std::optional<CheckedDisputeStatementSet> acceptAll(
      const DisputeStatementSet &set) {
    return CheckedDisputeStatementSet{set};
  }

  static std::vector<CandidateHash> hashesOf(
      const parasieve::dispute::CheckedMultiDisputeStatementSet &checked) {
    std::vector<CandidateHash> hashes;
    for (const auto &c : checked) {
      hashes.push_back(c.set.candidate_hash);
    }
    return hashes;
  }

  /// Ref time of a set with two statements
  static constexpr uint64_t kSetRefTime =
      TestWeightInfo::kDispute + 2 * TestWeightInfo::kStatement;

  TestWeightInfo weight_info;
  DisputesLimiter limiter{weight_info};
};

/**
 * @given statement sets repeating a (session, candidate) pair
 * @when deduplicating them
 * @then the first occurrence of each pair is kept in the original order
 */
TEST_F(DisputesLimiterTest, DeduplicateKeepsFirstOccurrence) {
  MultiDisputeStatementSet disputes{
      makeSet(1, 1, 1), makeSet(2, 1), makeSet(1, 1, 3), makeSet(1, 2)};
  EXPECT_TRUE(limiter.deduplicate(disputes));
  ASSERT_EQ(disputes.size(), 3);
  EXPECT_EQ(disputes[0].candidate_hash, fromNumber(1));
  EXPECT_EQ(disputes[0].statements.size(), 1);
  EXPECT_EQ(disputes[1].candidate_hash, fromNumber(2));
  EXPECT_EQ(disputes[2].candidate_hash, fromNumber(1));
  EXPECT_EQ(disputes[2].session, 2);

  EXPECT_FALSE(limiter.deduplicate(disputes));
  EXPECT_EQ(disputes.size(), 3);
}

/**
 * @given disputes fitting into the limit, one of them failing the check
 * @when limiting them
 * @then the failing set is dropped and only kept sets are weighed
 */
TEST_F(DisputesLimiterTest, UnderLimitChargesOnlyCheckedSets) {
  auto result = limiter.limitAndSanitizeDisputes(
      {makeSet(1, 1), makeSet(2, 1), makeSet(3, 1)},
      [](const DisputeStatementSet &set)
          -> std::optional<CheckedDisputeStatementSet> {
        if (set.candidate_hash == fromNumber(2)) {
          return std::nullopt;
        }
        return CheckedDisputeStatementSet{set};
      },
      {1000, kUnlimitedProofSize});

  EXPECT_EQ(hashesOf(result.checked),
            (std::vector<CandidateHash>{fromNumber(1), fromNumber(3)}));
  EXPECT_EQ(result.weight,
            checkedMultiDisputeStatementSetsWeight(weight_info,
                                                   result.checked));
  EXPECT_EQ(result.weight.ref_time, 2 * kSetRefTime);
}

/**
 * @given three disputes where the second one overflows the limit and the
 * third one would still fit after it
 * @when limiting them
 * @then only the prefix before the overflowing set is taken
 */
TEST_F(DisputesLimiterTest, OverLimitTakesPrefixOnly) {
  auto result = limiter.limitAndSanitizeDisputes(
      {makeSet(1, 1), makeSet(2, 1, 20), makeSet(3, 1)},
      acceptAll,
      {2 * kSetRefTime + 10, kUnlimitedProofSize});

  EXPECT_EQ(hashesOf(result.checked),
            (std::vector<CandidateHash>{fromNumber(1)}));
  EXPECT_EQ(result.weight.ref_time, kSetRefTime);
  EXPECT_TRUE(
      result.weight.allLte({2 * kSetRefTime + 10, kUnlimitedProofSize}));
}

/**
 * @given disputes over the limit, the first one failing the check
 * @when limiting them
 * @then the failing set is dropped but its weight is still charged
 */
TEST_F(DisputesLimiterTest, OverLimitChargesRejectedSets) {
  auto result = limiter.limitAndSanitizeDisputes(
      {makeSet(1, 1), makeSet(2, 1), makeSet(3, 1)},
      [](const DisputeStatementSet &set)
          -> std::optional<CheckedDisputeStatementSet> {
        if (set.candidate_hash == fromNumber(1)) {
          return std::nullopt;
        }
        return CheckedDisputeStatementSet{set};
      },
      {2 * kSetRefTime, kUnlimitedProofSize});

  EXPECT_EQ(hashesOf(result.checked),
            (std::vector<CandidateHash>{fromNumber(2)}));
  EXPECT_EQ(result.weight.ref_time, 2 * kSetRefTime);
}

/**
 * @given duplicated disputes
 * @when limiting them
 * @then duplicates are neither checked nor charged
 */
TEST_F(DisputesLimiterTest, DuplicatesAreRemovedBeforeLimiting) {
  size_t checks = 0;
  auto result = limiter.limitAndSanitizeDisputes(
      {makeSet(1, 1), makeSet(1, 1)},
      [&](const DisputeStatementSet &set) {
        ++checks;
        return acceptAll(set);
      },
      {1000, kUnlimitedProofSize});

  EXPECT_EQ(checks, 1);
  EXPECT_EQ(result.checked.size(), 1);
  EXPECT_EQ(result.weight.ref_time, kSetRefTime);
}
