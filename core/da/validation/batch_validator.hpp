/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <memory>
#include <vector>

#include "da/types.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace danode {
  class ThreadPool;
}  // namespace danode

namespace danode::da {
  class ChunkValidator;

  enum class BatchValidatorError : uint8_t {
    VALIDATOR_THREW = 1,
  };
  Q_ENUM_ERROR_CODE(BatchValidatorError) {
    using E = decltype(e);
    switch (e) {
      case E::VALIDATOR_THREW:
        return "Blob validation terminated with an exception";
    }
    abort();
  }

  /**
   * Validates independent blob messages of one batch in parallel, one
   * validateBlob call per blob, against a shared operator state
   */
  class BatchValidator {
   public:
    BatchValidator(std::shared_ptr<ChunkValidator> validator,
                   std::shared_ptr<ThreadPool> thread_pool);

    /// Result of every blob, in input order. A validator exception is
    /// reported as VALIDATOR_THREW for its blob
    std::vector<outcome::result<void>> validateEach(
        const std::vector<BlobMessage> &blobs,
        const OperatorState &state) const;

    /// Fails with the error of the first rejected blob in input order
    outcome::result<void> validateBlobs(const std::vector<BlobMessage> &blobs,
                                        const OperatorState &state) const;

   private:
    std::shared_ptr<ChunkValidator> validator_;
    std::shared_ptr<ThreadPool> thread_pool_;
    log::Logger log_;
  };

}  // namespace danode::da
