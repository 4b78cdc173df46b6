/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/validation/impl/chunk_validator_impl.hpp"

#include <set>

#include <boost/assert.hpp>
#include <boost/multiprecision/cpp_int.hpp>

#include "da/assignment/assignment_coordinator.hpp"
#include "da/encoding/encoder.hpp"
#include "da/encoding_params.hpp"

namespace danode::da {

  using E = ChunkValidationError;

  ChunkValidatorImpl::ChunkValidatorImpl(
      std::shared_ptr<Encoder> encoder,
      std::shared_ptr<AssignmentCoordinator> assignment,
      const OperatorId &operator_id)
      : encoder_(std::move(encoder)),
        assignment_(std::move(assignment)),
        operator_id_(operator_id),
        log_(log::createLogger("ChunkValidator", "chunk_validator")) {
    BOOST_ASSERT(encoder_);
    BOOST_ASSERT(assignment_);
  }

  outcome::result<void> ChunkValidatorImpl::validateBlob(
      const BlobMessage &blob, const OperatorState &state) const {
    // one identity for the whole call
    const auto operator_id = operatorId();
    const auto &header = blob.header;

    if (blob.bundles.size() != header.quorum_infos.size()) {
      SL_DEBUG(log_,
               "Blob has {} bundles for {} quorums",
               blob.bundles.size(),
               header.quorum_infos.size());
      return E::BUNDLE_COUNT_MISMATCH;
    }
    for (const auto &quorum : header.quorum_infos) {
      if (not blob.bundles.contains(quorum.security_param.quorum_id)) {
        SL_DEBUG(log_,
                 "No bundle for quorum {}",
                 quorum.security_param.quorum_id);
        return E::BUNDLE_COUNT_MISMATCH;
      }
    }

    if (auto res = encoder_->verifyBlobLength(header.commitments);
        res.has_error()) {
      SL_DEBUG(log_,
               "Blob length {} rejected: {}",
               header.commitments.length,
               res.error());
      return E::COMMITMENT_LENGTH_INVALID;
    }

    std::set<QuorumId> seen;
    for (const auto &quorum : header.quorum_infos) {
      const auto &param = quorum.security_param;
      if (param.adversary_threshold == 0
          or param.adversary_threshold >= param.quorum_threshold
          or param.quorum_threshold > kPercentMultiplier) {
        SL_DEBUG(log_,
                 "Quorum {} has invalid thresholds: adversary {}, quorum {}",
                 param.quorum_id,
                 param.adversary_threshold,
                 param.quorum_threshold);
        return E::INVALID_HEADER;
      }
      if (not seen.emplace(param.quorum_id).second) {
        SL_DEBUG(log_, "Quorum {} is listed twice", param.quorum_id);
        return E::INVALID_HEADER;
      }

      auto members = state.operators.find(param.quorum_id);
      if (members == state.operators.end()
          or not members->second.contains(operator_id)) {
        SL_TRACE(log_,
                 "Operator {} is not a member of quorum {}",
                 operator_id,
                 param.quorum_id);
        continue;
      }

      OUTCOME_TRY(validateQuorum(blob, state, quorum, operator_id));
    }

    return outcome::success();
  }

  outcome::result<void> ChunkValidatorImpl::validateQuorum(
      const BlobMessage &blob,
      const OperatorState &state,
      const QuorumHeader &header,
      const OperatorId &operator_id) const {
    const auto &param = header.security_param;
    const auto &commitments = blob.header.commitments;

    auto assignment_res = assignment_->getOperatorAssignment(
        state, param.quorum_id, header.quantization_factor, operator_id);
    if (assignment_res.has_error()) {
      SL_DEBUG(log_,
               "Can not assign chunks of quorum {}: {}",
               param.quorum_id,
               assignment_res.error());
      return E::ASSIGNMENT_ERROR;
    }
    const auto &[assignment, info] = assignment_res.value();

    if (assignment.num_chunks == 0) {
      SL_TRACE(log_, "No chunks of quorum {} assigned", param.quorum_id);
      return outcome::success();
    }

    const auto &chunks = blob.bundles.at(param.quorum_id);
    if (chunks.size() != assignment.num_chunks) {
      SL_DEBUG(log_,
               "Quorum {}: received {} chunks, assigned {}",
               param.quorum_id,
               chunks.size(),
               assignment.num_chunks);
      return E::CHUNK_COUNT_MISMATCH;
    }

    auto chunk_length_res = assignment_->getChunkLengthFromHeader(state, header);
    if (chunk_length_res.has_error()) {
      SL_DEBUG(log_,
               "Can not derive chunk length of quorum {}: {}",
               param.quorum_id,
               chunk_length_res.error());
      return E::ASSIGNMENT_ERROR;
    }
    const auto chunk_length = chunk_length_res.value();

    const auto num_operators = state.operators.at(param.quorum_id).size();
    auto min_chunk_length_res =
        assignment_->getMinimumChunkLength(num_operators,
                                           commitments.length,
                                           header.quantization_factor,
                                           param.quorum_threshold,
                                           param.adversary_threshold);
    if (min_chunk_length_res.has_error()) {
      SL_DEBUG(log_,
               "Can not derive minimum chunk length of quorum {}: {}",
               param.quorum_id,
               min_chunk_length_res.error());
      return E::ASSIGNMENT_ERROR;
    }

    auto params_res =
        getEncodingParams(min_chunk_length_res.value(), info.total_chunks);
    if (params_res.has_error()) {
      SL_DEBUG(log_,
               "Can not derive encoding of quorum {}: {}",
               param.quorum_id,
               params_res.error());
      return E::INVALID_HEADER;
    }
    const auto &params = params_res.value();

    if (params.chunk_length != chunk_length) {
      SL_DEBUG(log_,
               "Quorum {}: header implies chunk length {}, expected {}",
               param.quorum_id,
               chunk_length,
               params.chunk_length);
      return E::CHUNK_COUNT_MISMATCH;
    }

    for (const auto &chunk : chunks) {
      if (chunk.length() != chunk_length) {
        SL_DEBUG(log_,
                 "Quorum {}: chunk of {} symbols, expected {}",
                 param.quorum_id,
                 chunk.length(),
                 chunk_length);
        return E::CHUNK_LENGTH_MISMATCH;
      }
    }

    using boost::multiprecision::cpp_int;
    const cpp_int capacity =
        cpp_int(chunk_length) * header.quantization_factor * num_operators;
    if (capacity != header.encoded_blob_length) {
      SL_DEBUG(log_,
               "Quorum {}: encoded length {} does not match capacity {}",
               param.quorum_id,
               header.encoded_blob_length,
               capacity.str());
      return E::INVALID_HEADER;
    }

    if (auto res = encoder_->verifyChunks(
            chunks, assignment.getIndices(), commitments, params);
        res.has_error()) {
      SL_WARN(log_,
              "Chunks of quorum {} do not open against commitment {}: {}",
              param.quorum_id,
              commitments.commitment,
              res.error());
      return E::COMMITMENT_OPENING_INVALID;
    }

    SL_TRACE(log_,
             "Quorum {}: {} chunks from index {} are valid",
             param.quorum_id,
             assignment.num_chunks,
             assignment.start_index);
    return outcome::success();
  }

  void ChunkValidatorImpl::updateOperatorId(const OperatorId &operator_id) {
    std::unique_lock lock{operator_id_mutex_};
    operator_id_ = operator_id;
  }

  OperatorId ChunkValidatorImpl::operatorId() const {
    std::shared_lock lock{operator_id_mutex_};
    return operator_id_;
  }

}  // namespace danode::da
