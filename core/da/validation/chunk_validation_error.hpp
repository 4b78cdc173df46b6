/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace danode::da {

  /// Reasons a received blob message is rejected
  enum class ChunkValidationError : uint8_t {
    BUNDLE_COUNT_MISMATCH = 1,
    COMMITMENT_LENGTH_INVALID,
    INVALID_HEADER,
    ASSIGNMENT_ERROR,
    CHUNK_COUNT_MISMATCH,
    CHUNK_LENGTH_MISMATCH,
    COMMITMENT_OPENING_INVALID,
  };

}  // namespace danode::da

OUTCOME_HPP_DECLARE_ERROR(danode::da, ChunkValidationError)
