/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace danode::da {

  enum class AssignmentError : uint8_t {
    QUORUM_NOT_FOUND = 1,
    OPERATOR_NOT_FOUND,
    ZERO_QUANTIZATION_FACTOR,
    NO_OPERATORS,
    INVALID_THRESHOLDS,
    ARITHMETIC_OVERFLOW,
  };

}  // namespace danode::da

OUTCOME_HPP_DECLARE_ERROR(danode::da, AssignmentError)
