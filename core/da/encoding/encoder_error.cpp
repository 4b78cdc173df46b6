/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/encoding/encoder_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(danode::da, EncoderError, e) {
  using E = danode::da::EncoderError;
  switch (e) {
    case E::ZERO_LENGTH:
      return "Declared blob length is zero";
    case E::BLOB_TOO_LONG:
      return "Declared blob length exceeds the configured maximum";
    case E::NO_ERASURE_ROOTS:
      return "Commitments carry no erasure roots";
    case E::INVALID_ENCODING_PARAMS:
      return "Encoding parameters must be powers of two";
    case E::INSUFFICIENT_CAPACITY:
      return "Encoding can not hold the declared blob length";
    case E::ZERO_COMMITMENT:
      return "Commitment is zero";
    case E::COMMITMENT_MISMATCH:
      return "Commitment does not match the declared length and roots";
    case E::WRONG_CHUNK_COUNT:
      return "Number of chunks does not match number of indices";
    case E::UNKNOWN_ENCODING:
      return "No erasure root committed for the encoding parameters";
    case E::CHUNK_INDEX_OUT_OF_RANGE:
      return "Chunk index exceeds the number of chunks of the encoding";
    case E::CHUNK_LENGTH_MISMATCH:
      return "Chunk length differs from the encoding chunk length";
    case E::PROOF_LENGTH_MISMATCH:
      return "Chunk proof depth does not match the encoding";
    case E::PROOF_MISMATCH:
      return "Chunk proof does not lead to the erasure root";
  }
  return "unknown EncoderError";
}
