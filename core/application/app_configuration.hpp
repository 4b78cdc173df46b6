/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "da/types.hpp"

namespace danode::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    static constexpr size_t kDefaultThreads = 1;
    static constexpr uint64_t kDefaultMaxBlobLength = 16384;

    virtual ~AppConfiguration() = default;

    /**
     * @return identity the chunks are validated for
     */
    virtual const da::OperatorId &operatorId() const = 0;

    /**
     * @return file with the operator state snapshot
     */
    virtual const std::filesystem::path &chainStatePath() const = 0;

    /**
     * @return files with blob messages to validate, in order
     */
    virtual const std::vector<std::filesystem::path> &blobPaths() const = 0;

    /**
     * @return block to take the operator state at, the current block of the
     * chain state when not set
     */
    virtual std::optional<da::BlockNumber> referenceBlock() const = 0;

    /**
     * @return number of threads blobs are validated on
     */
    virtual size_t threads() const = 0;

    /**
     * @return largest accepted blob length in symbols
     */
    virtual uint64_t maxBlobLength() const = 0;

    /**
     * @return logging tuning entries, `<level>` or `<group>=<level>`
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace danode::application
