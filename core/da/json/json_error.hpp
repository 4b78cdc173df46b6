/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace danode::da {

  enum class JsonError : uint8_t {
    PARSE_ERROR = 1,
    NOT_AN_OBJECT,
    MISSING_FIELD,
    WRONG_TYPE,
    INVALID_NUMBER,
    INVALID_HEX,
    DUPLICATE_ENTRY,
  };

}  // namespace danode::da

OUTCOME_HPP_DECLARE_ERROR(danode::da, JsonError)
