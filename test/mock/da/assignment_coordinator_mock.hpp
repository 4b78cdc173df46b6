/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/assignment/assignment_coordinator.hpp"

#include <gmock/gmock.h>

namespace danode::da {

  class AssignmentCoordinatorMock : public AssignmentCoordinator {
   public:
    using AssignmentsResult =
        outcome::result<std::pair<Assignments, AssignmentInfo>>;
    using OperatorAssignmentResult =
        outcome::result<std::pair<Assignment, AssignmentInfo>>;

    MOCK_METHOD(AssignmentsResult,
                getAssignments,
                (const OperatorState &, QuorumId, uint32_t),
                (const, override));

    MOCK_METHOD(OperatorAssignmentResult,
                getOperatorAssignment,
                (const OperatorState &, QuorumId, uint32_t, const OperatorId &),
                (const, override));

    MOCK_METHOD(outcome::result<size_t>,
                getMinimumChunkLength,
                (size_t, uint64_t, uint32_t, Threshold, Threshold),
                (const, override));

    MOCK_METHOD(outcome::result<size_t>,
                getChunkLengthFromHeader,
                (const OperatorState &, const QuorumHeader &),
                (const, override));
  };

}  // namespace danode::da
