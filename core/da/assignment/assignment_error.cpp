/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/assignment/assignment_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(danode::da, AssignmentError, e) {
  using E = danode::da::AssignmentError;
  switch (e) {
    case E::QUORUM_NOT_FOUND:
      return "Quorum has no operators in the operator state";
    case E::OPERATOR_NOT_FOUND:
      return "Operator is not a member of the quorum";
    case E::ZERO_QUANTIZATION_FACTOR:
      return "Quantization factor must be positive";
    case E::NO_OPERATORS:
      return "Number of operators must be positive";
    case E::INVALID_THRESHOLDS:
      return "Quorum threshold must exceed adversary threshold and be at "
             "most 100";
    case E::ARITHMETIC_OVERFLOW:
      return "Assignment arithmetic overflows the chunk index range";
  }
  return "unknown AssignmentError";
}
