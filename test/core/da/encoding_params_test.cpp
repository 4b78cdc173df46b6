/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/encoding_params.hpp"

#include <limits>

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using danode::da::EncodingParams;
using danode::da::EncodingParamsError;
using danode::da::getEncodingParams;
using danode::da::nextPowerOf2;

TEST(EncodingParamsTest, NextPowerOf2) {
  EXPECT_EQ(nextPowerOf2(1), 1);
  EXPECT_EQ(nextPowerOf2(2), 2);
  EXPECT_EQ(nextPowerOf2(3), 4);
  EXPECT_EQ(nextPowerOf2(2560), 4096);
  EXPECT_EQ(nextPowerOf2(4096), 4096);
  EXPECT_FALSE(nextPowerOf2(std::numeric_limits<size_t>::max()).has_value());
}

/**
 * @given minimum chunk length and number of chunks
 * @when derive encoding params
 * @then both are rounded up to powers of two
 */
TEST(EncodingParamsTest, RoundsUp) {
  ASSERT_OUTCOME_SUCCESS(params, getEncodingParams(2560, 5));
  EXPECT_EQ(params, (EncodingParams{.chunk_length = 4096, .num_chunks = 8}));
}

/**
 * @given zero or unrepresentable minimums
 * @when derive encoding params
 * @then corresponding errors are returned
 */
TEST(EncodingParamsTest, Errors) {
  EXPECT_EC(getEncodingParams(0, 4), EncodingParamsError::ZERO_CHUNK_LENGTH);
  EXPECT_EC(getEncodingParams(4, 0), EncodingParamsError::ZERO_NUM_CHUNKS);
  EXPECT_EC(getEncodingParams(std::numeric_limits<size_t>::max(), 4),
            EncodingParamsError::TOO_LARGE);
}
