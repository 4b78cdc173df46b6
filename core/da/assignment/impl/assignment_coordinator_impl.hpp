/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/assignment/assignment_coordinator.hpp"

#include "log/logger.hpp"

namespace danode::da {

  /**
   * Operator `i` of a quorum with `n` operators receives
   * `ceil(stake_i * n * quantization_factor / total_stake)` chunks. Ranges of
   * chunk indices are laid out contiguously in the order of on-chain operator
   * index, ties broken by operator id.
   */
  class AssignmentCoordinatorImpl final : public AssignmentCoordinator {
   public:
    AssignmentCoordinatorImpl();

    outcome::result<std::pair<Assignments, AssignmentInfo>> getAssignments(
        const OperatorState &state,
        QuorumId quorum_id,
        uint32_t quantization_factor) const override;

    outcome::result<std::pair<Assignment, AssignmentInfo>>
    getOperatorAssignment(const OperatorState &state,
                          QuorumId quorum_id,
                          uint32_t quantization_factor,
                          const OperatorId &operator_id) const override;

    outcome::result<size_t> getMinimumChunkLength(
        size_t num_operators,
        uint64_t blob_length,
        uint32_t quantization_factor,
        Threshold quorum_threshold,
        Threshold adversary_threshold) const override;

    outcome::result<size_t> getChunkLengthFromHeader(
        const OperatorState &state, const QuorumHeader &header) const override;

   private:
    log::Logger log_;
  };

}  // namespace danode::da
