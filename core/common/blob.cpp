/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(danode::common, BlobError, e) {
  using danode::common::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}
