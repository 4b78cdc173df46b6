/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <vector>

#include "da/types.hpp"
#include "outcome/outcome.hpp"

namespace danode::da {

  enum class ChainStateError : uint8_t {
    UNKNOWN_BLOCK = 1,
  };
  Q_ENUM_ERROR_CODE(ChainStateError) {
    using E = decltype(e);
    switch (e) {
      case E::UNKNOWN_BLOCK:
        return "Operator state is not known at the requested block";
    }
    abort();
  }

  /**
   * Source of operator set snapshots
   */
  class ChainState {
   public:
    virtual ~ChainState() = default;

    /**
     * @param block_number reference block of the snapshot
     * @param quorums quorums to include, others are omitted
     */
    virtual outcome::result<OperatorState> getOperatorState(
        BlockNumber block_number,
        const std::vector<QuorumId> &quorums) const = 0;

    virtual outcome::result<BlockNumber> getCurrentBlockNumber() const = 0;
  };

}  // namespace danode::da
