/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/json/json_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(danode::da, JsonError, e) {
  using E = danode::da::JsonError;
  switch (e) {
    case E::PARSE_ERROR:
      return "Document is not valid JSON";
    case E::NOT_AN_OBJECT:
      return "JSON object expected";
    case E::MISSING_FIELD:
      return "Required field is missing";
    case E::WRONG_TYPE:
      return "Field has unexpected type";
    case E::INVALID_NUMBER:
      return "Field is not a number in the allowed range";
    case E::INVALID_HEX:
      return "Field is not a 0x-prefixed hex string of expected length";
    case E::DUPLICATE_ENTRY:
      return "Entry is listed more than once";
  }
  return "unknown JsonError";
}
