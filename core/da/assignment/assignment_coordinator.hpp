/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <utility>

#include "da/types.hpp"
#include "outcome/outcome.hpp"

namespace danode::da {

  /**
   * Maps stake to chunk entitlements. Results depend only on the arguments,
   * so the disperser and every operator agree without communication.
   */
  class AssignmentCoordinator {
   public:
    using Assignments = std::map<OperatorId, Assignment>;

    virtual ~AssignmentCoordinator() = default;

    /**
     * Splits the chunk budget of the quorum between all of its operators
     * proportionally to stake
     * @param state operator set snapshot
     * @param quorum_id quorum to assign chunks of
     * @param quantization_factor chunks per operator at equal stake
     * @return assignment of every quorum member and the quorum total
     */
    virtual outcome::result<std::pair<Assignments, AssignmentInfo>>
    getAssignments(const OperatorState &state,
                   QuorumId quorum_id,
                   uint32_t quantization_factor) const = 0;

    /**
     * Same as getAssignments, but returns the entry of one operator only
     */
    virtual outcome::result<std::pair<Assignment, AssignmentInfo>>
    getOperatorAssignment(const OperatorState &state,
                          QuorumId quorum_id,
                          uint32_t quantization_factor,
                          const OperatorId &operator_id) const = 0;

    /**
     * Smallest chunk length with which any quorum-threshold share of stake
     * can reconstruct `blob_length` symbols, while an adversary-threshold
     * share can not
     */
    virtual outcome::result<size_t> getMinimumChunkLength(
        size_t num_operators,
        uint64_t blob_length,
        uint32_t quantization_factor,
        Threshold quorum_threshold,
        Threshold adversary_threshold) const = 0;

    /// Chunk length implied by the encoded length declared in the header
    virtual outcome::result<size_t> getChunkLengthFromHeader(
        const OperatorState &state, const QuorumHeader &header) const = 0;
  };

}  // namespace danode::da
