/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "common/blob.hpp"

namespace danode::da {

  using QuorumId = uint8_t;
  using ChunkIndex = uint32_t;
  using OperatorIndex = uint32_t;
  using BlockNumber = uint32_t;
  using Stake = boost::multiprecision::uint256_t;

  /// Stake percentage, in (0, 100]
  using Threshold = uint8_t;

  /// Number of bytes in one symbol (field element) of a chunk
  constexpr size_t kSymbolSize = 32;

  constexpr uint64_t kPercentMultiplier = 100;

  using OperatorId = common::Blob<32>;
  using Symbol = common::Blob<kSymbolSize>;
  using Commitment = common::Hash256;

  /// Sibling hashes from the chunk leaf up to the root
  using ChunkProof = std::vector<common::Hash256>;

  struct SecurityParam {
    QuorumId quorum_id = 0;
    /// Maximum stake share an adversary is assumed to control
    Threshold adversary_threshold = 0;
    /// Stake share which must be able to reconstruct the blob
    Threshold quorum_threshold = 0;

    bool operator==(const SecurityParam &) const = default;
  };

  /// Per-quorum part of a blob header, declared by the disperser
  struct QuorumHeader {
    SecurityParam security_param;
    uint32_t quantization_factor = 0;
    /// Total number of symbols committed to across the whole quorum
    uint64_t encoded_blob_length = 0;

    bool operator==(const QuorumHeader &) const = default;
  };

  /// Shape of the erasure code, both values are powers of two
  struct EncodingParams {
    size_t chunk_length = 0;
    size_t num_chunks = 0;

    bool operator==(const EncodingParams &) const = default;
  };

  /// Merkle root over all chunks of one erasure encoding of the blob
  struct ErasureRoot {
    EncodingParams params;
    common::Hash256 root;

    bool operator==(const ErasureRoot &) const = default;
  };

  struct BlobCommitments {
    /// Binds the declared length and every erasure root
    Commitment commitment;
    /// Declared data length, in symbols
    uint64_t length = 0;
    /// Opening material, one entry per distinct encoding of the blob
    std::vector<ErasureRoot> erasure_roots;

    bool operator==(const BlobCommitments &) const = default;
  };

  struct BlobHeader {
    BlobCommitments commitments;
    std::vector<QuorumHeader> quorum_infos;
  };

  /// Erasure-coded fragment of a blob
  struct Chunk {
    std::vector<Symbol> coeffs;
    ChunkProof proof;

    /// Number of symbols carried by the chunk
    size_t length() const {
      return coeffs.size();
    }
  };

  using Bundle = std::vector<Chunk>;
  using Bundles = std::map<QuorumId, Bundle>;

  /// Blob header and the chunks sent to one operator
  struct BlobMessage {
    BlobHeader header;
    Bundles bundles;
  };

  struct OperatorInfo {
    Stake stake;
    /// Position of the operator in the on-chain registry
    OperatorIndex index = 0;
  };

  using QuorumOperators = std::map<OperatorId, OperatorInfo>;

  /// Operator set snapshot at a reference block
  struct OperatorState {
    std::map<QuorumId, QuorumOperators> operators;
    BlockNumber block_number = 0;
  };

  struct Assignment {
    ChunkIndex start_index = 0;
    size_t num_chunks = 0;

    std::vector<ChunkIndex> getIndices() const {
      std::vector<ChunkIndex> indices;
      indices.reserve(num_chunks);
      for (size_t i = 0; i < num_chunks; ++i) {
        indices.push_back(start_index + static_cast<ChunkIndex>(i));
      }
      return indices;
    }

    bool operator==(const Assignment &) const = default;
  };

  struct AssignmentInfo {
    size_t total_chunks = 0;

    bool operator==(const AssignmentInfo &) const = default;
  };

}  // namespace danode::da
