/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <span>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace danode::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Blob of fixed size, used for hashes, identities and field elements
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    bool isZero() const {
      return std::ranges::all_of(*this, [](uint8_t b) { return b == 0; });
    }

    static outcome::result<Blob<size_>> fromSpan(
        std::span<const uint8_t> span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::ranges::copy(span, blob.begin());
      return blob;
    }

    static outcome::result<Blob<size_>> fromHexWithPrefix(
        std::string_view hex) {
      OUTCOME_TRY(res, unhexWith0x(hex));
      return fromSpan(res);
    }
  };

  using Hash256 = Blob<32>;

}  // namespace danode::common

template <size_t N>
struct fmt::formatter<danode::common::Blob<N>> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = N > 4 ? 's' : 'l';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const danode::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(ctx.out(),
                            "0x{:02x}{:02x}…{:02x}{:02x}",
                            blob[0],
                            blob[1],
                            blob[N - 2],
                            blob[N - 1]);
    }
    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};

OUTCOME_HPP_DECLARE_ERROR(danode::common, BlobError);
