/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace danode::da {

  enum class EncoderError : uint8_t {
    ZERO_LENGTH = 1,
    BLOB_TOO_LONG,
    NO_ERASURE_ROOTS,
    INVALID_ENCODING_PARAMS,
    INSUFFICIENT_CAPACITY,
    ZERO_COMMITMENT,
    COMMITMENT_MISMATCH,
    WRONG_CHUNK_COUNT,
    UNKNOWN_ENCODING,
    CHUNK_INDEX_OUT_OF_RANGE,
    CHUNK_LENGTH_MISMATCH,
    PROOF_LENGTH_MISMATCH,
    PROOF_MISMATCH,
  };

}  // namespace danode::da

OUTCOME_HPP_DECLARE_ERROR(danode::da, EncoderError)
