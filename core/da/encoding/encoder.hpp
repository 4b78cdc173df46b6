/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "da/types.hpp"
#include "outcome/outcome.hpp"

namespace danode::da {

  /**
   * Checks blob data against the commitment published by the disperser.
   * A failure is final, repeating the check on the same input gives the same
   * result.
   */
  class Encoder {
   public:
    virtual ~Encoder() = default;

    /**
     * Confirms that the commitment is well-formed for its declared length
     */
    virtual outcome::result<void> verifyBlobLength(
        const BlobCommitments &commitments) const = 0;

    /**
     * Confirms that every chunk opens against the commitment at the index of
     * the same position
     * @param chunks received chunks
     * @param indices chunk indices, one per chunk
     * @param commitments blob commitments from the header
     * @param params shape of the erasure code the chunks belong to
     */
    virtual outcome::result<void> verifyChunks(
        const std::vector<Chunk> &chunks,
        const std::vector<ChunkIndex> &indices,
        const BlobCommitments &commitments,
        const EncodingParams &params) const = 0;
  };

}  // namespace danode::da
