/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/sha.h>

namespace danode::crypto {
  common::Hash256 sha256(std::span<const uint8_t> input) {
    return sha256(std::initializer_list<std::span<const uint8_t>>{input});
  }

  common::Hash256 sha256(
      std::initializer_list<std::span<const uint8_t>> parts) {
    common::Hash256 out;
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    for (auto &part : parts) {
      SHA256_Update(&ctx, part.data(), part.size());
    }
    SHA256_Final(out.data(), &ctx);
    return out;
  }
}  // namespace danode::crypto
