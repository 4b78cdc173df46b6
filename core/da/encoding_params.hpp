/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <bit>
#include <cstdlib>
#include <limits>
#include <optional>

#include "da/types.hpp"
#include "outcome/outcome.hpp"

namespace danode::da {

  enum class EncodingParamsError : uint8_t {
    ZERO_CHUNK_LENGTH = 1,
    ZERO_NUM_CHUNKS,
    TOO_LARGE,
  };
  Q_ENUM_ERROR_CODE(EncodingParamsError) {
    using E = decltype(e);
    switch (e) {
      case E::ZERO_CHUNK_LENGTH:
        return "Minimum chunk length must be positive";
      case E::ZERO_NUM_CHUNKS:
        return "Minimum number of chunks must be positive";
      case E::TOO_LARGE:
        return "Encoding parameter does not fit into the next power of two";
    }
    abort();
  }

  /// Smallest power of two not less than `value`, if representable
  inline std::optional<size_t> nextPowerOf2(size_t value) {
    constexpr size_t kMaxPowerOf2 =
        size_t{1} << (std::numeric_limits<size_t>::digits - 1);
    if (value > kMaxPowerOf2) {
      return std::nullopt;
    }
    return std::bit_ceil(value);
  }

  /**
   * Derives the shape the erasure code must have to carry chunks of at least
   * `min_chunk_length` symbols to at least `min_num_chunks` recipients.
   */
  inline outcome::result<EncodingParams> getEncodingParams(
      size_t min_chunk_length, size_t min_num_chunks) {
    if (min_chunk_length == 0) {
      return EncodingParamsError::ZERO_CHUNK_LENGTH;
    }
    if (min_num_chunks == 0) {
      return EncodingParamsError::ZERO_NUM_CHUNKS;
    }
    auto chunk_length = nextPowerOf2(min_chunk_length);
    auto num_chunks = nextPowerOf2(min_num_chunks);
    if (not chunk_length or not num_chunks) {
      return EncodingParamsError::TOO_LARGE;
    }
    return EncodingParams{
        .chunk_length = *chunk_length,
        .num_chunks = *num_chunks,
    };
  }

}  // namespace danode::da
