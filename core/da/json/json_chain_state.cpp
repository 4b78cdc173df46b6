/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/json/json_chain_state.hpp"

#include <limits>

#include "da/json/json_utils.hpp"
#include "utils/read_file.hpp"

namespace danode::da {

  JsonChainState::JsonChainState(OperatorState state)
      : state_(std::move(state)),
        log_(log::createLogger("JsonChainState", "chain_state")) {
    SL_VERBOSE(log_,
               "Operator state at block {} with {} quorums",
               state_.block_number,
               state_.operators.size());
  }

  outcome::result<std::shared_ptr<JsonChainState>> JsonChainState::parse(
      std::string_view text) {
    rapidjson::Document document;
    OUTCOME_TRY(json::parse(document, text));

    OperatorState state;
    OUTCOME_TRY(block_number,
                json::getU64(document,
                             "block_number",
                             std::numeric_limits<BlockNumber>::max()));
    state.block_number = static_cast<BlockNumber>(block_number);

    OUTCOME_TRY(operators, json::getArray(document, "operators"));
    for (const auto &entry : operators) {
      OUTCOME_TRY(id, json::getBlob<OperatorId::size()>(entry, "id"));
      OUTCOME_TRY(
          index,
          json::getU64(
              entry, "index", std::numeric_limits<OperatorIndex>::max()));
      OUTCOME_TRY(stakes, json::getObject(entry, "stakes"));
      for (const auto &stake_entry : stakes) {
        std::string_view key{stake_entry.name.GetString(),
                             stake_entry.name.GetStringLength()};
        OUTCOME_TRY(quorum_id,
                    json::parseU64(key, std::numeric_limits<QuorumId>::max()));
        OUTCOME_TRY(stake, json::parseStake(stake_entry.value));
        auto [_, inserted] =
            state.operators[static_cast<QuorumId>(quorum_id)].emplace(
                id,
                OperatorInfo{
                    .stake = stake,
                    .index = static_cast<OperatorIndex>(index),
                });
        if (not inserted) {
          return JsonError::DUPLICATE_ENTRY;
        }
      }
    }

    return std::make_shared<JsonChainState>(std::move(state));
  }

  outcome::result<std::shared_ptr<JsonChainState>> JsonChainState::load(
      const std::filesystem::path &path) {
    OUTCOME_TRY(text, readText(path));
    return parse(text);
  }

  outcome::result<OperatorState> JsonChainState::getOperatorState(
      BlockNumber block_number, const std::vector<QuorumId> &quorums) const {
    if (block_number != state_.block_number) {
      SL_DEBUG(log_,
               "Requested block {}, known block {}",
               block_number,
               state_.block_number);
      return ChainStateError::UNKNOWN_BLOCK;
    }
    OperatorState state{.block_number = state_.block_number};
    for (auto quorum_id : quorums) {
      if (auto it = state_.operators.find(quorum_id);
          it != state_.operators.end()) {
        state.operators.emplace(*it);
      }
    }
    return state;
  }

  outcome::result<BlockNumber> JsonChainState::getCurrentBlockNumber() const {
    return state_.block_number;
  }

}  // namespace danode::da
