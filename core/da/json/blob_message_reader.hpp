/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string_view>

#include "da/types.hpp"
#include "outcome/outcome.hpp"

namespace danode::da {

  /**
   * Reads a blob message from JSON:
   * @code
   * {
   *   "header": {
   *     "commitment": "0x..",
   *     "length": 16,
   *     "erasure_roots": [
   *       {"chunk_length": 8, "num_chunks": 8, "root": "0x.."}
   *     ],
   *     "quorums": [
   *       {"quorum_id": 0, "adversary_threshold": 50,
   *        "quorum_threshold": 100, "quantization_factor": 2,
   *        "encoded_blob_length": 64}
   *     ]
   *   },
   *   "bundles": {
   *     "0": [{"coeffs": ["0x..", ...], "proof": ["0x..", ...]}]
   *   }
   * }
   * @endcode
   */
  outcome::result<BlobMessage> parseBlobMessage(std::string_view text);

  outcome::result<BlobMessage> loadBlobMessage(
      const std::filesystem::path &path);

}  // namespace danode::da
