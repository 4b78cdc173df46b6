/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/encoding/encoder.hpp"

#include "log/logger.hpp"

namespace danode::da {

  struct MerkleEncoderConfig {
    /// Largest accepted blob, in symbols
    uint64_t max_blob_length = 16384;
  };

  /**
   * Encoder which commits to every erasure encoding of a blob with a binary
   * Merkle tree over its chunks.
   *
   * Leaf of chunk `i` is `sha256(0x00 || symbols)`, inner node is
   * `sha256(0x01 || left || right)`. The blob commitment is
   * `sha256(le64(length) || le64(chunk_length) || le64(num_chunks) || root
   * || ...)` over all erasure roots in the order they are listed.
   */
  class MerkleEncoder final : public Encoder {
   public:
    explicit MerkleEncoder(MerkleEncoderConfig config);

    outcome::result<void> verifyBlobLength(
        const BlobCommitments &commitments) const override;

    outcome::result<void> verifyChunks(
        const std::vector<Chunk> &chunks,
        const std::vector<ChunkIndex> &indices,
        const BlobCommitments &commitments,
        const EncodingParams &params) const override;

    /**
     * Builds the Merkle tree over a complete encoding and stores the
     * inclusion proof into each chunk
     * @param chunks all `params.num_chunks` chunks, in index order
     * @return erasure root of the encoding
     */
    static outcome::result<ErasureRoot> encodeRoot(std::vector<Chunk> &chunks,
                                                   const EncodingParams &params);

    /**
     * Binds the declared length to erasure roots, keeping only the first
     * root for each set of encoding parameters
     */
    static BlobCommitments makeCommitments(
        uint64_t length, const std::vector<ErasureRoot> &roots);

    static Commitment computeCommitment(
        uint64_t length, const std::vector<ErasureRoot> &roots);

   private:
    MerkleEncoderConfig config_;
    log::Logger log_;
  };

}  // namespace danode::da
