/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/validation/batch_validator.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

#include "da/validation/chunk_validation_error.hpp"
#include "mock/da/chunk_validator_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "utils/thread_pool.hpp"

using danode::ThreadPool;
using namespace danode::da;
using testing::_;
using testing::Invoke;
using testing::Return;
using testing::Throw;

class BatchValidatorTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    thread_pool_ = std::make_shared<ThreadPool>("test_batch", 4);
    batch_ = std::make_shared<BatchValidator>(validator_, thread_pool_);
  }

  /// Blobs are told apart by their declared length
  static std::vector<BlobMessage> makeBlobs(size_t count) {
    std::vector<BlobMessage> blobs(count);
    for (size_t i = 0; i < count; ++i) {
      blobs[i].header.commitments.length = i;
    }
    return blobs;
  }

 protected:
  std::shared_ptr<ChunkValidatorMock> validator_ =
      std::make_shared<ChunkValidatorMock>();
  std::shared_ptr<ThreadPool> thread_pool_;
  std::shared_ptr<BatchValidator> batch_;
  OperatorState state_{.block_number = 7};
};

/**
 * @given empty batch
 * @when validate it
 * @then nothing is validated and the batch is accepted
 */
TEST_F(BatchValidatorTest, EmptyBatch) {
  EXPECT_CALL(*validator_, validateBlob(_, _)).Times(0);
  EXPECT_TRUE(batch_->validateEach({}, state_).empty());
  EXPECT_OUTCOME_SUCCESS(batch_->validateBlobs({}, state_));
}

/**
 * @given batch where some blobs are rejected
 * @when validate each blob
 * @then every result lands at the position of its blob
 */
TEST_F(BatchValidatorTest, ResultsInInputOrder) {
  auto blobs = makeBlobs(32);
  EXPECT_CALL(*validator_, validateBlob(_, _))
      .Times(32)
      .WillRepeatedly(Invoke(
          [](const BlobMessage &blob,
             const OperatorState &state) -> outcome::result<void> {
            EXPECT_EQ(state.block_number, 7);
            if (blob.header.commitments.length % 3 == 0) {
              return ChunkValidationError::CHUNK_COUNT_MISMATCH;
            }
            return outcome::success();
          }));

  auto results = batch_->validateEach(blobs, state_);
  ASSERT_EQ(results.size(), blobs.size());
  for (size_t i = 0; i < results.size(); ++i) {
    if (i % 3 == 0) {
      EXPECT_EC(results[i], ChunkValidationError::CHUNK_COUNT_MISMATCH);
    } else {
      EXPECT_OUTCOME_SUCCESS(results[i]);
    }
  }
}

/**
 * @given batch with two rejected blobs
 * @when validate the batch
 * @then the error of the earlier one is returned
 */
TEST_F(BatchValidatorTest, FirstErrorInInputOrder) {
  auto blobs = makeBlobs(8);
  EXPECT_CALL(*validator_, validateBlob(_, _))
      .Times(8)
      .WillRepeatedly(Invoke(
          [](const BlobMessage &blob,
             const OperatorState &) -> outcome::result<void> {
            switch (blob.header.commitments.length) {
              case 2:
                // finishes last
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                return ChunkValidationError::INVALID_HEADER;
              case 5:
                return ChunkValidationError::COMMITMENT_OPENING_INVALID;
              default:
                return outcome::success();
            }
          }));

  EXPECT_EC(batch_->validateBlobs(blobs, state_),
            ChunkValidationError::INVALID_HEADER);
}

/**
 * @given batch of valid blobs and a pool of several threads
 * @when validate the batch
 * @then blobs are validated concurrently on pool threads
 */
TEST_F(BatchValidatorTest, RunsOnPoolThreads) {
  auto blobs = makeBlobs(16);
  std::mutex mutex;
  std::set<std::thread::id> threads;
  std::atomic_size_t running = 0;
  std::atomic_size_t max_running = 0;
  EXPECT_CALL(*validator_, validateBlob(_, _))
      .Times(16)
      .WillRepeatedly(
          Invoke([&](const BlobMessage &,
                     const OperatorState &) -> outcome::result<void> {
            auto now = ++running;
            auto seen = max_running.load();
            while (now > seen
                   and not max_running.compare_exchange_weak(seen, now)) {
            }
            {
              std::lock_guard lock{mutex};
              threads.emplace(std::this_thread::get_id());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
            return outcome::success();
          }));

  EXPECT_OUTCOME_SUCCESS(batch_->validateBlobs(blobs, state_));
  EXPECT_FALSE(threads.contains(std::this_thread::get_id()));
  EXPECT_LE(threads.size(), thread_pool_->size());
  EXPECT_GT(max_running.load(), 1);
}

/**
 * @given batch where the validator throws on one blob
 * @when validate each blob
 * @then the batch completes, the throwing blob is reported as
 * VALIDATOR_THREW and the other blobs keep their results
 */
TEST_F(BatchValidatorTest, ValidatorThrows) {
  auto blobs = makeBlobs(6);
  EXPECT_CALL(*validator_, validateBlob(_, _))
      .Times(5)
      .WillRepeatedly(Return(outcome::success()));
  EXPECT_CALL(*validator_,
              validateBlob(testing::Field(
                               &BlobMessage::header,
                               testing::Field(
                                   &BlobHeader::commitments,
                                   testing::Field(&BlobCommitments::length,
                                                  uint64_t{3}))),
                           _))
      .WillOnce(Throw(std::runtime_error("decoder failure")));

  auto results = batch_->validateEach(blobs, state_);
  ASSERT_EQ(results.size(), blobs.size());
  for (size_t i = 0; i < results.size(); ++i) {
    if (i == 3) {
      EXPECT_EC(results[i], BatchValidatorError::VALIDATOR_THREW);
    } else {
      EXPECT_OUTCOME_SUCCESS(results[i]);
    }
  }

  EXPECT_CALL(*validator_, validateBlob(_, _))
      .WillOnce(Throw(std::runtime_error("decoder failure")));
  EXPECT_EC(batch_->validateBlobs(makeBlobs(1), state_),
            BatchValidatorError::VALIDATOR_THREW);
}
