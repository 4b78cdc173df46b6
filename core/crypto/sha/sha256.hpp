/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <initializer_list>
#include <span>

#include "common/blob.hpp"

namespace danode::crypto {
  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  common::Hash256 sha256(std::span<const uint8_t> input);

  /**
   * Take a SHA-256 hash of the concatenation of several byte ranges
   * without copying them into one buffer
   */
  common::Hash256 sha256(std::initializer_list<std::span<const uint8_t>> parts);
}  // namespace danode::crypto
