/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"

using namespace parasieve::common;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::array<byte_t, 2> expected{0, 255};

  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHex("00ff"));
  EXPECT_EQ(blob, expected);
  EXPECT_EQ(blob.toHex(), "00ff");
}

/**
 * @given non hex string
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromNonHex) {
  EXPECT_EC(Blob<2>::fromHex("nothex"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given hex string of a different length than the blob
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromHexOfWrongLength) {
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given blob of 32 bytes
 * @when formatting it
 * @then short and long forms are produced
 */
TEST(BlobTest, Format) {
  Hash256 hash;
  hash[0] = 0x12;
  hash[31] = 0xab;
  EXPECT_EQ(fmt::format("{}", hash), "0x1200…00ab");
  EXPECT_EQ(fmt::format("{:l}", hash), "0x" + hash.toHex());
}
