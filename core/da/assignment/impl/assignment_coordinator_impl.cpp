/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/assignment/impl/assignment_coordinator_impl.hpp"

#include <algorithm>
#include <limits>

#include <boost/multiprecision/cpp_int.hpp>

#include "da/assignment/assignment_error.hpp"

namespace danode::da {

  namespace {
    using boost::multiprecision::cpp_int;

    cpp_int roundUpDivide(const cpp_int &numerator,
                          const cpp_int &denominator) {
      return (numerator + denominator - 1) / denominator;
    }

    outcome::result<const QuorumOperators *> findQuorum(
        const OperatorState &state, QuorumId quorum_id) {
      auto it = state.operators.find(quorum_id);
      if (it == state.operators.end() or it->second.empty()) {
        return AssignmentError::QUORUM_NOT_FOUND;
      }
      return &it->second;
    }
  }  // namespace

  AssignmentCoordinatorImpl::AssignmentCoordinatorImpl()
      : log_(log::createLogger("AssignmentCoordinator", "assignment")) {}

  outcome::result<
      std::pair<AssignmentCoordinator::Assignments, AssignmentInfo>>
  AssignmentCoordinatorImpl::getAssignments(
      const OperatorState &state,
      QuorumId quorum_id,
      uint32_t quantization_factor) const {
    OUTCOME_TRY(operators, findQuorum(state, quorum_id));
    if (quantization_factor == 0) {
      return AssignmentError::ZERO_QUANTIZATION_FACTOR;
    }

    cpp_int total_stake = 0;
    for (const auto &[id, info] : *operators) {
      total_stake += cpp_int(info.stake);
    }
    // every operator gets at most `budget` chunks, plus one for rounding up
    const cpp_int budget = cpp_int(operators->size()) * quantization_factor;
    if (budget + operators->size()
        > std::numeric_limits<ChunkIndex>::max()) {
      return AssignmentError::ARITHMETIC_OVERFLOW;
    }

    struct Entry {
      const OperatorId *id;
      OperatorIndex index;
      size_t num_chunks;
    };
    std::vector<Entry> entries;
    entries.reserve(operators->size());
    for (const auto &[id, info] : *operators) {
      // a quorum without stake entitles nobody to chunks
      cpp_int chunks = 0;
      if (total_stake != 0) {
        chunks = roundUpDivide(cpp_int(info.stake) * budget, total_stake);
      }
      entries.push_back(Entry{
          .id = &id,
          .index = info.index,
          .num_chunks = chunks.convert_to<size_t>(),
      });
    }
    std::ranges::sort(entries, [](const Entry &lhs, const Entry &rhs) {
      if (lhs.index != rhs.index) {
        return lhs.index < rhs.index;
      }
      return *lhs.id < *rhs.id;
    });

    Assignments assignments;
    size_t next_index = 0;
    for (const auto &entry : entries) {
      assignments.emplace(*entry.id,
                          Assignment{
                              .start_index = static_cast<ChunkIndex>(next_index),
                              .num_chunks = entry.num_chunks,
                          });
      next_index += entry.num_chunks;
    }

    SL_TRACE(log_,
             "Quorum {}: {} chunks assigned to {} operators "
             "(quantization factor {})",
             quorum_id,
             next_index,
             operators->size(),
             quantization_factor);

    return std::make_pair(std::move(assignments),
                          AssignmentInfo{.total_chunks = next_index});
  }

  outcome::result<std::pair<Assignment, AssignmentInfo>>
  AssignmentCoordinatorImpl::getOperatorAssignment(
      const OperatorState &state,
      QuorumId quorum_id,
      uint32_t quantization_factor,
      const OperatorId &operator_id) const {
    OUTCOME_TRY(assignments,
                getAssignments(state, quorum_id, quantization_factor));
    auto &[all, info] = assignments;
    auto it = all.find(operator_id);
    if (it == all.end()) {
      return AssignmentError::OPERATOR_NOT_FOUND;
    }
    return std::make_pair(it->second, info);
  }

  outcome::result<size_t> AssignmentCoordinatorImpl::getMinimumChunkLength(
      size_t num_operators,
      uint64_t blob_length,
      uint32_t quantization_factor,
      Threshold quorum_threshold,
      Threshold adversary_threshold) const {
    if (quorum_threshold <= adversary_threshold
        or quorum_threshold > kPercentMultiplier) {
      return AssignmentError::INVALID_THRESHOLDS;
    }
    if (quantization_factor == 0) {
      return AssignmentError::ZERO_QUANTIZATION_FACTOR;
    }
    if (num_operators == 0) {
      return AssignmentError::NO_OPERATORS;
    }

    // Rounding up gives every operator at most one extra chunk, so the
    // stake gap has to cover twice the data to stay safe.
    const cpp_int numerator = cpp_int(2) * blob_length * kPercentMultiplier;
    const cpp_int denominator = cpp_int(quorum_threshold - adversary_threshold)
                              * quantization_factor * num_operators;
    auto length = roundUpDivide(numerator, denominator);
    if (length > std::numeric_limits<size_t>::max()) {
      return AssignmentError::ARITHMETIC_OVERFLOW;
    }
    return length.convert_to<size_t>();
  }

  outcome::result<size_t> AssignmentCoordinatorImpl::getChunkLengthFromHeader(
      const OperatorState &state, const QuorumHeader &header) const {
    OUTCOME_TRY(operators,
                findQuorum(state, header.security_param.quorum_id));
    if (header.quantization_factor == 0) {
      return AssignmentError::ZERO_QUANTIZATION_FACTOR;
    }
    const cpp_int divisor =
        cpp_int(header.quantization_factor) * operators->size();
    const cpp_int length = cpp_int(header.encoded_blob_length) / divisor;
    return length.convert_to<size_t>();
  }

}  // namespace danode::da
