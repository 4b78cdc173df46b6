/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <algorithm>
#include <map>

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using danode::common::Blob;
using danode::common::BlobError;
using danode::common::Hash256;

/**
 * @given span of the blob size
 * @when create blob from it
 * @then blob holds the same bytes
 */
TEST(BlobTest, FromSpan) {
  std::vector<uint8_t> bytes{1, 2, 3, 4};
  ASSERT_OUTCOME_SUCCESS(blob, Blob<4>::fromSpan(bytes));
  ASSERT_TRUE(std::equal(blob.begin(), blob.end(), bytes.begin()));
  ASSERT_EQ(blob.toHex(), "01020304");
}

/**
 * @given span longer than the blob
 * @when create blob from it
 * @then INCORRECT_LENGTH
 */
TEST(BlobTest, FromSpanWrongLength) {
  std::vector<uint8_t> bytes{1, 2, 3, 4, 5};
  ASSERT_OUTCOME_ERROR(Blob<4>::fromSpan(bytes), BlobError::INCORRECT_LENGTH);
}

/**
 * @given 0x-prefixed hex of 32 bytes
 * @when create hash from it
 * @then hash is parsed and formatted back in full and short forms
 */
TEST(BlobTest, FromHexWithPrefix) {
  std::string hex =
      "0x0102030000000000000000000000000000000000000000000000000000000aff";
  ASSERT_OUTCOME_SUCCESS(hash, Hash256::fromHexWithPrefix(hex));
  ASSERT_FALSE(hash.isZero());
  ASSERT_EQ(fmt::format("{:l}", hash), hex);
  ASSERT_EQ(fmt::format("{}", hash), "0x0102…0aff");

  ASSERT_OUTCOME_ERROR(Hash256::fromHexWithPrefix("0x0102"),
                       BlobError::INCORRECT_LENGTH);
  ASSERT_TRUE(Hash256{}.isZero());
}

/**
 * @given blobs differing in their first and last bytes
 * @when use them as keys of an ordered map
 * @then keys are ordered bytewise from the first byte
 */
TEST(BlobTest, OrderedMapKey) {
  Blob<2> a{std::array<uint8_t, 2>{0, 9}};
  Blob<2> b{std::array<uint8_t, 2>{1, 0}};
  Blob<2> c{std::array<uint8_t, 2>{1, 1}};
  std::map<Blob<2>, int> map{{c, 3}, {a, 1}, {b, 2}};
  ASSERT_EQ(map.size(), 3);
  auto it = map.begin();
  EXPECT_EQ((it++)->second, 1);
  EXPECT_EQ((it++)->second, 2);
  EXPECT_EQ(it->second, 3);
}
