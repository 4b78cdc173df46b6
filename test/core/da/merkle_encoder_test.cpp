/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/encoding/impl/merkle_encoder.hpp"

#include <limits>

#include <gtest/gtest.h>

#include "da/encoding/encoder_error.hpp"
#include "testutil/da/dispersal.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace danode::da;
using testutil::da::makeSymbol;

class MerkleEncoderTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    chunks_ = makeChunks(params_);
    auto root = MerkleEncoder::encodeRoot(chunks_, params_);
    ASSERT_TRUE(root.has_value());
    commitments_ = MerkleEncoder::makeCommitments(20, {root.value()});
  }

 protected:
  static std::vector<Chunk> makeChunks(const EncodingParams &params) {
    std::vector<Chunk> chunks(params.num_chunks);
    for (size_t i = 0; i < chunks.size(); ++i) {
      for (size_t j = 0; j < params.chunk_length; ++j) {
        chunks[i].coeffs.push_back(makeSymbol(params, i, j));
      }
    }
    return chunks;
  }

  std::vector<ChunkIndex> allIndices() const {
    return Assignment{.start_index = 0, .num_chunks = params_.num_chunks}
        .getIndices();
  }

  EncodingParams params_{.chunk_length = 4, .num_chunks = 8};
  std::vector<Chunk> chunks_;
  BlobCommitments commitments_;
  MerkleEncoder encoder_{MerkleEncoderConfig{.max_blob_length = 32}};
};

/**
 * @given complete encoding of a blob
 * @when encode its root
 * @then every chunk gets a proof of tree depth
 */
TEST_F(MerkleEncoderTest, EncodeRootFillsProofs) {
  for (const auto &chunk : chunks_) {
    EXPECT_EQ(chunk.proof.size(), 3);
  }
  ASSERT_EQ(commitments_.erasure_roots.size(), 1);
  EXPECT_EQ(commitments_.erasure_roots[0].params, params_);
  EXPECT_FALSE(commitments_.commitment.isZero());
}

TEST_F(MerkleEncoderTest, EncodeRootErrors) {
  auto chunks = makeChunks(params_);
  chunks.pop_back();
  EXPECT_EC(MerkleEncoder::encodeRoot(chunks, params_),
            EncoderError::WRONG_CHUNK_COUNT);

  chunks = makeChunks(params_);
  chunks[3].coeffs.pop_back();
  EXPECT_EC(MerkleEncoder::encodeRoot(chunks, params_),
            EncoderError::CHUNK_LENGTH_MISMATCH);

  EXPECT_EC(MerkleEncoder::encodeRoot(
                chunks, EncodingParams{.chunk_length = 3, .num_chunks = 8}),
            EncoderError::INVALID_ENCODING_PARAMS);
}

/**
 * @given well-formed commitments
 * @when verify blob length
 * @then verification succeeds
 */
TEST_F(MerkleEncoderTest, VerifyBlobLength) {
  EXPECT_OUTCOME_SUCCESS(encoder_.verifyBlobLength(commitments_));
}

/**
 * @given commitments with the length changed after committing
 * @when verify blob length
 * @then the commitment does not match any more
 */
TEST_F(MerkleEncoderTest, LengthNotBoundByCommitment) {
  auto commitments = commitments_;
  commitments.length = 21;
  EXPECT_EC(encoder_.verifyBlobLength(commitments),
            EncoderError::COMMITMENT_MISMATCH);

  commitments = commitments_;
  commitments.commitment[0] ^= 1;
  EXPECT_EC(encoder_.verifyBlobLength(commitments),
            EncoderError::COMMITMENT_MISMATCH);

  commitments = commitments_;
  commitments.commitment = Commitment{};
  EXPECT_EC(encoder_.verifyBlobLength(commitments),
            EncoderError::ZERO_COMMITMENT);
}

TEST_F(MerkleEncoderTest, BlobLengthErrors) {
  const auto &roots = commitments_.erasure_roots;
  EXPECT_EC(encoder_.verifyBlobLength(MerkleEncoder::makeCommitments(0, roots)),
            EncoderError::ZERO_LENGTH);
  EXPECT_EC(
      encoder_.verifyBlobLength(MerkleEncoder::makeCommitments(33, roots)),
      EncoderError::BLOB_TOO_LONG);
  EXPECT_EC(encoder_.verifyBlobLength(MerkleEncoder::makeCommitments(20, {})),
            EncoderError::NO_ERASURE_ROOTS);

  auto odd = roots;
  odd[0].params.num_chunks = 6;
  EXPECT_EC(encoder_.verifyBlobLength(MerkleEncoder::makeCommitments(20, odd)),
            EncoderError::INVALID_ENCODING_PARAMS);

  auto small = roots;
  small[0].params = EncodingParams{.chunk_length = 2, .num_chunks = 8};
  EXPECT_EC(
      encoder_.verifyBlobLength(MerkleEncoder::makeCommitments(20, small)),
      EncoderError::INSUFFICIENT_CAPACITY);
}

/**
 * @given encoder without a practical length limit and a blob length at the
 * top of the integer range
 * @when verify encodings with too little and with enough capacity
 * @then the small encoding is rejected and the large one accepted
 */
TEST_F(MerkleEncoderTest, CapacityNearLengthLimit) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  MerkleEncoder encoder{MerkleEncoderConfig{.max_blob_length = kMax}};
  auto verify = [&](size_t chunk_length) {
    auto root = commitments_.erasure_roots[0];
    root.params =
        EncodingParams{.chunk_length = chunk_length, .num_chunks = 2};
    return encoder.verifyBlobLength(
        MerkleEncoder::makeCommitments(kMax, {root}));
  };

  EXPECT_EC(verify(1), EncoderError::INSUFFICIENT_CAPACITY);
  EXPECT_EC(verify(size_t{1} << 62), EncoderError::INSUFFICIENT_CAPACITY);
  EXPECT_OUTCOME_SUCCESS(verify(size_t{1} << 63));
}

/**
 * @given roots listed twice for the same encoding
 * @when make commitments
 * @then only the first one is kept
 */
TEST_F(MerkleEncoderTest, MakeCommitmentsDeduplicates) {
  auto root = commitments_.erasure_roots[0];
  auto other = root;
  other.root[0] ^= 1;
  auto commitments = MerkleEncoder::makeCommitments(20, {root, other});
  ASSERT_EQ(commitments.erasure_roots.size(), 1);
  EXPECT_EQ(commitments.erasure_roots[0], root);
  EXPECT_EQ(commitments, commitments_);
}

/**
 * @given all chunks of the encoding or a consecutive part of them
 * @when verify them against the commitments
 * @then verification succeeds
 */
TEST_F(MerkleEncoderTest, VerifyChunks) {
  EXPECT_OUTCOME_SUCCESS(
      encoder_.verifyChunks(chunks_, allIndices(), commitments_, params_));

  std::vector<Chunk> part{chunks_[2], chunks_[3], chunks_[4]};
  EXPECT_OUTCOME_SUCCESS(
      encoder_.verifyChunks(part, {2, 3, 4}, commitments_, params_));
}

/**
 * @given chunk with one symbol changed
 * @when verify it
 * @then proof does not lead to the root
 */
TEST_F(MerkleEncoderTest, TamperedSymbol) {
  std::vector<Chunk> part{chunks_[5]};
  part[0].coeffs[1][7] ^= 0x80;
  EXPECT_EC(encoder_.verifyChunks(part, {5}, commitments_, params_),
            EncoderError::PROOF_MISMATCH);
}

/**
 * @given valid chunks presented at each other's indices
 * @when verify them
 * @then proof does not lead to the root
 */
TEST_F(MerkleEncoderTest, SwappedIndices) {
  std::vector<Chunk> part{chunks_[0], chunks_[1]};
  EXPECT_EC(encoder_.verifyChunks(part, {1, 0}, commitments_, params_),
            EncoderError::PROOF_MISMATCH);
}

TEST_F(MerkleEncoderTest, VerifyChunksErrors) {
  std::vector<Chunk> part{chunks_[0], chunks_[1]};
  EXPECT_EC(encoder_.verifyChunks(part, {0}, commitments_, params_),
            EncoderError::WRONG_CHUNK_COUNT);

  EXPECT_EC(encoder_.verifyChunks(
                part,
                {0, 1},
                commitments_,
                EncodingParams{.chunk_length = 4, .num_chunks = 16}),
            EncoderError::UNKNOWN_ENCODING);

  EXPECT_EC(encoder_.verifyChunks(part, {0, 8}, commitments_, params_),
            EncoderError::CHUNK_INDEX_OUT_OF_RANGE);

  auto longer = part;
  longer[1].coeffs.push_back(Symbol{});
  EXPECT_EC(encoder_.verifyChunks(longer, {0, 1}, commitments_, params_),
            EncoderError::CHUNK_LENGTH_MISMATCH);

  auto shallow = part;
  shallow[0].proof.pop_back();
  EXPECT_EC(encoder_.verifyChunks(shallow, {0, 1}, commitments_, params_),
            EncoderError::PROOF_LENGTH_MISMATCH);
}

/**
 * @given encoding of a single chunk
 * @when encode and verify it
 * @then the root is the leaf itself and the proof is empty
 */
TEST_F(MerkleEncoderTest, SingleChunk) {
  EncodingParams params{.chunk_length = 32, .num_chunks = 1};
  auto chunks = makeChunks(params);
  ASSERT_OUTCOME_SUCCESS(root, MerkleEncoder::encodeRoot(chunks, params));
  EXPECT_TRUE(chunks[0].proof.empty());

  auto commitments = MerkleEncoder::makeCommitments(32, {root});
  EXPECT_OUTCOME_SUCCESS(encoder_.verifyBlobLength(commitments));
  EXPECT_OUTCOME_SUCCESS(
      encoder_.verifyChunks(chunks, {0}, commitments, params));
}
