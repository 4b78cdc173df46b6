/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/validation/chunk_validation_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(danode::da, ChunkValidationError, e) {
  using E = danode::da::ChunkValidationError;
  switch (e) {
    case E::BUNDLE_COUNT_MISMATCH:
      return "number of bundles does not match number of quorums";
    case E::COMMITMENT_LENGTH_INVALID:
      return "declared blob length does not match the commitment";
    case E::INVALID_HEADER:
      return "invalid header";
    case E::ASSIGNMENT_ERROR:
      return "chunk assignment can not be computed";
    case E::CHUNK_COUNT_MISMATCH:
      return "number of chunks does not match assignment";
    case E::CHUNK_LENGTH_MISMATCH:
      return "chunk length mismatch";
    case E::COMMITMENT_OPENING_INVALID:
      return "chunks do not open against the commitment";
  }
  return "unknown ChunkValidationError";
}
