/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <rapidjson/document.h>

#include "common/blob.hpp"
#include "da/json/json_error.hpp"
#include "da/types.hpp"

/**
 * Typed accessors over rapidjson values shared by the chain state and blob
 * message readers
 */
namespace danode::da::json {

  /// Parses `text` into `document`, logging the rapidjson error on failure
  outcome::result<void> parse(rapidjson::Document &document,
                              std::string_view text);

  outcome::result<const rapidjson::Value *> getMember(
      const rapidjson::Value &object, const char *name);

  outcome::result<uint64_t> getU64(const rapidjson::Value &object,
                                   const char *name);

  /// Like getU64, but fails with INVALID_NUMBER above `max`
  outcome::result<uint64_t> getU64(const rapidjson::Value &object,
                                   const char *name,
                                   uint64_t max);

  outcome::result<rapidjson::Value::ConstArray> getArray(
      const rapidjson::Value &object, const char *name);

  outcome::result<rapidjson::Value::ConstObject> getObject(
      const rapidjson::Value &object, const char *name);

  /// Decimal string such as a JSON object key
  outcome::result<uint64_t> parseU64(std::string_view decimal, uint64_t max);

  /// Stake is either a JSON unsigned integer or a decimal string
  outcome::result<Stake> parseStake(const rapidjson::Value &value);

  template <size_t N>
  outcome::result<common::Blob<N>> parseBlob(const rapidjson::Value &value) {
    if (not value.IsString()) {
      return JsonError::WRONG_TYPE;
    }
    auto blob = common::Blob<N>::fromHexWithPrefix(
        std::string_view{value.GetString(), value.GetStringLength()});
    if (blob.has_error()) {
      return JsonError::INVALID_HEX;
    }
    return blob.value();
  }

  template <size_t N>
  outcome::result<common::Blob<N>> getBlob(const rapidjson::Value &object,
                                           const char *name) {
    OUTCOME_TRY(value, getMember(object, name));
    return parseBlob<N>(*value);
  }

}  // namespace danode::da::json
