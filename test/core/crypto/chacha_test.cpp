/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/chacha.hpp"

#include <algorithm>
#include <numeric>

#include <gtest/gtest.h>

using parasieve::crypto::RandChaCha20;

/**
 * @given two generators with the same seed
 * @when shuffling equal sequences
 * @then they produce the same permutation
 */
TEST(RandChaCha20Test, ShuffleIsDeterministic) {
  RandChaCha20::Seed seed{};
  seed[0] = 1;

  std::vector<size_t> a(20);
  std::iota(a.begin(), a.end(), 0);
  auto b = a;
  const auto sorted = a;

  RandChaCha20{seed}.shuffle(a);
  RandChaCha20{seed}.shuffle(b);
  EXPECT_EQ(a, b);
  EXPECT_TRUE(std::is_permutation(a.begin(), a.end(), sorted.begin()));
}

/**
 * @given generators with different seeds
 * @when shuffling equal sequences
 * @then the permutations differ
 */
TEST(RandChaCha20Test, ShuffleDependsOnSeed) {
  RandChaCha20::Seed seed_a{};
  RandChaCha20::Seed seed_b{};
  seed_b[31] = 1;

  std::vector<size_t> a(50);
  std::iota(a.begin(), a.end(), 0);
  auto b = a;

  RandChaCha20{seed_a}.shuffle(a);
  RandChaCha20{seed_b}.shuffle(b);
  EXPECT_NE(a, b);
}

/**
 * @given empty and single element sequences
 * @when shuffling them
 * @then they are left as is
 */
TEST(RandChaCha20Test, ShuffleTrivialSequences) {
  RandChaCha20 rng{RandChaCha20::Seed{}};
  std::vector<int> empty;
  rng.shuffle(empty);
  EXPECT_TRUE(empty.empty());

  std::vector<int> one{7};
  rng.shuffle(one);
  EXPECT_EQ(one, std::vector<int>{7});
}
