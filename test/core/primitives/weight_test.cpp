/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/weight.hpp"

#include <limits>

#include <gtest/gtest.h>

using parasieve::primitives::Weight;

constexpr auto kMax = std::numeric_limits<uint64_t>::max();

/**
 * @given weights close to the numeric limits
 * @when adding or subtracting them with saturation
 * @then each dimension saturates independently
 */
TEST(WeightTest, SaturatingArithmetic) {
  const Weight a{kMax - 1, 10};
  EXPECT_EQ(a.saturatingAdd({5, 5}), (Weight{kMax, 15}));
  EXPECT_EQ(a.saturatingSub({5, 20}), (Weight{kMax - 6, 0}));

  Weight acc;
  acc += {kMax, 1};
  acc += {1, 1};
  EXPECT_EQ(acc, (Weight{kMax, 2}));
}

/**
 * @given two weights
 * @when subtracting with a check
 * @then underflow in any dimension gives nothing
 */
TEST(WeightTest, CheckedSub) {
  const Weight a{10, 10};
  EXPECT_EQ(a.checkedSub({3, 10}), (Weight{7, 0}));
  EXPECT_FALSE(a.checkedSub({11, 0}));
  EXPECT_FALSE(a.checkedSub({0, 11}));
}

/**
 * @given weights larger in one dimension only
 * @when comparing them
 * @then any- and all- comparisons treat dimensions separately
 */
TEST(WeightTest, Comparisons) {
  const Weight limit{100, 100};
  EXPECT_TRUE((Weight{101, 0}).anyGt(limit));
  EXPECT_TRUE((Weight{0, 101}).anyGt(limit));
  EXPECT_FALSE(limit.anyGt(limit));
  EXPECT_TRUE(limit.allGte({100, 50}));
  EXPECT_FALSE(limit.allGte({101, 50}));
  EXPECT_TRUE((Weight{100, 50}).allLte(limit));
  EXPECT_EQ(fmt::format("{}", Weight{1, 2}), "(ref_time: 1, proof_size: 2)");
}
