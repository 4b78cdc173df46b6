/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/chain_state.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

#include "log/logger.hpp"

namespace danode::da {

  /**
   * Chain state backed by a single snapshot read from a JSON document:
   * @code
   * {
   *   "block_number": 100,
   *   "operators": [
   *     {"id": "0x..", "index": 0, "stakes": {"0": "1000", "1": 500}}
   *   ]
   * }
   * @endcode
   * Stakes are decimal strings or unsigned integers, keyed by quorum id.
   */
  class JsonChainState final : public ChainState {
   public:
    explicit JsonChainState(OperatorState state);

    static outcome::result<std::shared_ptr<JsonChainState>> parse(
        std::string_view text);

    static outcome::result<std::shared_ptr<JsonChainState>> load(
        const std::filesystem::path &path);

    outcome::result<OperatorState> getOperatorState(
        BlockNumber block_number,
        const std::vector<QuorumId> &quorums) const override;

    outcome::result<BlockNumber> getCurrentBlockNumber() const override;

   private:
    OperatorState state_;
    log::Logger log_;
  };

}  // namespace danode::da
