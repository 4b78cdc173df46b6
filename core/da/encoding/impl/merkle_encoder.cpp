/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/encoding/impl/merkle_encoder.hpp"

#include <algorithm>
#include <bit>

#include "crypto/sha/sha256.hpp"
#include "da/encoding/encoder_error.hpp"

namespace danode::da {

  namespace {
    constexpr uint8_t kLeafPrefix = 0x00;
    constexpr uint8_t kNodePrefix = 0x01;

    void putLe64(std::vector<uint8_t> &out, uint64_t value) {
      for (size_t i = 0; i < sizeof(value); ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
      }
    }

    bool isPowerOf2(size_t value) {
      return std::has_single_bit(value);
    }

    common::Hash256 leafHash(const Chunk &chunk) {
      std::vector<uint8_t> symbols;
      symbols.reserve(chunk.length() * kSymbolSize);
      for (const auto &symbol : chunk.coeffs) {
        symbols.insert(symbols.end(), symbol.begin(), symbol.end());
      }
      return crypto::sha256({std::span(&kLeafPrefix, 1), symbols});
    }

    common::Hash256 nodeHash(const common::Hash256 &left,
                             const common::Hash256 &right) {
      return crypto::sha256({std::span(&kNodePrefix, 1), left, right});
    }

    const ErasureRoot *findRoot(const BlobCommitments &commitments,
                                const EncodingParams &params) {
      auto it = std::ranges::find(
          commitments.erasure_roots, params, &ErasureRoot::params);
      return it == commitments.erasure_roots.end() ? nullptr : &*it;
    }
  }  // namespace

  MerkleEncoder::MerkleEncoder(MerkleEncoderConfig config)
      : config_(config),
        log_(log::createLogger("MerkleEncoder", "encoding")) {}

  outcome::result<void> MerkleEncoder::verifyBlobLength(
      const BlobCommitments &commitments) const {
    if (commitments.length == 0) {
      return EncoderError::ZERO_LENGTH;
    }
    if (commitments.length > config_.max_blob_length) {
      SL_DEBUG(log_,
               "Blob length {} exceeds maximum {}",
               commitments.length,
               config_.max_blob_length);
      return EncoderError::BLOB_TOO_LONG;
    }
    if (commitments.erasure_roots.empty()) {
      return EncoderError::NO_ERASURE_ROOTS;
    }
    for (const auto &[params, root] : commitments.erasure_roots) {
      if (not isPowerOf2(params.chunk_length)
          or not isPowerOf2(params.num_chunks)) {
        return EncoderError::INVALID_ENCODING_PARAMS;
      }
      // chunk_length * num_chunks >= length, without the product and
      // without overflowing on lengths close to the type limit
      auto min_chunk_length = commitments.length / params.num_chunks
                            + (commitments.length % params.num_chunks != 0);
      if (params.chunk_length < min_chunk_length) {
        return EncoderError::INSUFFICIENT_CAPACITY;
      }
    }
    if (commitments.commitment.isZero()) {
      return EncoderError::ZERO_COMMITMENT;
    }
    auto expected =
        computeCommitment(commitments.length, commitments.erasure_roots);
    if (expected != commitments.commitment) {
      SL_DEBUG(log_,
               "Commitment mismatch: declared {}, computed {}",
               commitments.commitment,
               expected);
      return EncoderError::COMMITMENT_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> MerkleEncoder::verifyChunks(
      const std::vector<Chunk> &chunks,
      const std::vector<ChunkIndex> &indices,
      const BlobCommitments &commitments,
      const EncodingParams &params) const {
    if (chunks.size() != indices.size()) {
      return EncoderError::WRONG_CHUNK_COUNT;
    }
    const auto *erasure_root = findRoot(commitments, params);
    if (erasure_root == nullptr) {
      SL_DEBUG(log_,
               "No erasure root for chunk length {} and {} chunks",
               params.chunk_length,
               params.num_chunks);
      return EncoderError::UNKNOWN_ENCODING;
    }
    const auto depth = static_cast<size_t>(std::countr_zero(params.num_chunks));

    for (size_t i = 0; i < chunks.size(); ++i) {
      const auto &chunk = chunks[i];
      size_t position = indices[i];
      if (position >= params.num_chunks) {
        return EncoderError::CHUNK_INDEX_OUT_OF_RANGE;
      }
      if (chunk.length() != params.chunk_length) {
        return EncoderError::CHUNK_LENGTH_MISMATCH;
      }
      if (chunk.proof.size() != depth) {
        return EncoderError::PROOF_LENGTH_MISMATCH;
      }
      auto hash = leafHash(chunk);
      for (const auto &sibling : chunk.proof) {
        hash = (position & 1) != 0 ? nodeHash(sibling, hash)
                                   : nodeHash(hash, sibling);
        position >>= 1;
      }
      if (hash != erasure_root->root) {
        SL_DEBUG(log_, "Proof of chunk {} does not match the root", indices[i]);
        return EncoderError::PROOF_MISMATCH;
      }
    }
    return outcome::success();
  }

  outcome::result<ErasureRoot> MerkleEncoder::encodeRoot(
      std::vector<Chunk> &chunks, const EncodingParams &params) {
    if (not isPowerOf2(params.chunk_length)
        or not isPowerOf2(params.num_chunks)) {
      return EncoderError::INVALID_ENCODING_PARAMS;
    }
    if (chunks.size() != params.num_chunks) {
      return EncoderError::WRONG_CHUNK_COUNT;
    }

    std::vector<std::vector<common::Hash256>> levels(1);
    levels[0].reserve(chunks.size());
    for (const auto &chunk : chunks) {
      if (chunk.length() != params.chunk_length) {
        return EncoderError::CHUNK_LENGTH_MISMATCH;
      }
      levels[0].push_back(leafHash(chunk));
    }
    while (levels.back().size() > 1) {
      const auto &level = levels.back();
      std::vector<common::Hash256> next;
      next.reserve(level.size() / 2);
      for (size_t i = 0; i < level.size(); i += 2) {
        next.push_back(nodeHash(level[i], level[i + 1]));
      }
      levels.emplace_back(std::move(next));
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
      ChunkProof proof;
      proof.reserve(levels.size() - 1);
      size_t position = i;
      for (size_t depth = 0; depth + 1 < levels.size(); ++depth) {
        proof.push_back(levels[depth][position ^ 1]);
        position >>= 1;
      }
      chunks[i].proof = std::move(proof);
    }

    return ErasureRoot{.params = params, .root = levels.back().front()};
  }

  BlobCommitments MerkleEncoder::makeCommitments(
      uint64_t length, const std::vector<ErasureRoot> &roots) {
    BlobCommitments commitments{.length = length};
    for (const auto &root : roots) {
      if (findRoot(commitments, root.params) == nullptr) {
        commitments.erasure_roots.push_back(root);
      }
    }
    commitments.commitment =
        computeCommitment(length, commitments.erasure_roots);
    return commitments;
  }

  Commitment MerkleEncoder::computeCommitment(
      uint64_t length, const std::vector<ErasureRoot> &roots) {
    std::vector<uint8_t> buffer;
    buffer.reserve(8 + roots.size() * (16 + common::Hash256::size()));
    putLe64(buffer, length);
    for (const auto &[params, root] : roots) {
      putLe64(buffer, params.chunk_length);
      putLe64(buffer, params.num_chunks);
      buffer.insert(buffer.end(), root.begin(), root.end());
    }
    return crypto::sha256(buffer);
  }

}  // namespace danode::da
