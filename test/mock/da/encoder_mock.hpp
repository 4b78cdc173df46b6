/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/encoding/encoder.hpp"

#include <gmock/gmock.h>

namespace danode::da {

  class EncoderMock : public Encoder {
   public:
    MOCK_METHOD(outcome::result<void>,
                verifyBlobLength,
                (const BlobCommitments &),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                verifyChunks,
                (const std::vector<Chunk> &,
                 const std::vector<ChunkIndex> &,
                 const BlobCommitments &,
                 const EncodingParams &),
                (const, override));
  };

}  // namespace danode::da
