/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/validation/batch_validator.hpp"

#include <exception>
#include <latch>

#include <boost/asio/post.hpp>
#include <boost/assert.hpp>

#include "da/validation/chunk_validator.hpp"
#include "utils/thread_pool.hpp"

namespace danode::da {

  BatchValidator::BatchValidator(std::shared_ptr<ChunkValidator> validator,
                                 std::shared_ptr<ThreadPool> thread_pool)
      : validator_(std::move(validator)),
        thread_pool_(std::move(thread_pool)),
        log_(log::createLogger("BatchValidator", "batch_validator")) {
    BOOST_ASSERT(validator_);
    BOOST_ASSERT(thread_pool_);
  }

  std::vector<outcome::result<void>> BatchValidator::validateEach(
      const std::vector<BlobMessage> &blobs, const OperatorState &state) const {
    std::vector<outcome::result<void>> results(blobs.size(),
                                               outcome::success());
    if (blobs.empty()) {
      return results;
    }

    std::latch done{static_cast<std::ptrdiff_t>(blobs.size())};
    for (size_t i = 0; i < blobs.size(); ++i) {
      boost::asio::post(*thread_pool_->io_context(),
                        [this, &blobs, &state, &results, &done, i] {
                          try {
                            results[i] =
                                validator_->validateBlob(blobs[i], state);
                          } catch (const std::exception &e) {
                            SL_ERROR(log_,
                                     "Validation of blob #{} threw: {}",
                                     i,
                                     e.what());
                            results[i] = BatchValidatorError::VALIDATOR_THREW;
                          }
                          done.count_down();
                        });
    }
    done.wait();

    SL_DEBUG(log_,
             "Validated {} blobs at block {} on {} threads",
             blobs.size(),
             state.block_number,
             thread_pool_->size());
    return results;
  }

  outcome::result<void> BatchValidator::validateBlobs(
      const std::vector<BlobMessage> &blobs, const OperatorState &state) const {
    auto results = validateEach(blobs, state);
    for (size_t i = 0; i < results.size(); ++i) {
      if (results[i].has_error()) {
        SL_VERBOSE(log_, "Blob #{} rejected: {}", i, results[i].error());
        return results[i].error();
      }
    }
    return outcome::success();
  }

}  // namespace danode::da
