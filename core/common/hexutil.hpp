/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace danode::common {

  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
  };

  std::string hex_lower(std::span<const uint8_t> bytes);

  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  /**
   * Converts hex representation to bytes
   * @param hex hex string without prefix
   * @return bytes or NOT_ENOUGH_INPUT for an odd number of characters,
   * NON_HEX_INPUT for any character outside of [0-9a-fA-F]
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /// Same as unhex, but requires the `0x` prefix
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace danode::common

OUTCOME_HPP_DECLARE_ERROR(danode::common, UnhexError);
