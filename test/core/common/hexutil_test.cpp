/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace danode::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Hexutil, Hex) {
  std::vector<uint8_t> bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length in mixed case
 * @when unhex
 * @then result matches expected bytes
 */
TEST(Hexutil, UnhexEven) {
  ASSERT_OUTCOME_SUCCESS(actual, unhex("00010204081020Ff"));
  std::vector<uint8_t> expected{
      0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then NOT_ENOUGH_INPUT
 */
TEST(Hexutil, UnhexOdd) {
  ASSERT_OUTCOME_ERROR(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then NON_HEX_INPUT
 */
TEST(Hexutil, UnhexInvalid) {
  ASSERT_OUTCOME_ERROR(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given Hex string with and without 0x prefix
 * @when unhexWith0x
 * @then prefixed string is decoded, other one is rejected
 */
TEST(Hexutil, UnhexWith0x) {
  ASSERT_OUTCOME_SUCCESS(actual, unhexWith0x("0xdead"));
  ASSERT_EQ(actual, (std::vector<uint8_t>{0xde, 0xad}));
  ASSERT_OUTCOME_ERROR(unhexWith0x("dead"), UnhexError::MISSING_0X_PREFIX);
}
