/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "da/json/json_utils.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

#include <rapidjson/error/en.h>

#include "log/logger.hpp"

namespace danode::da::json {

  outcome::result<void> parse(rapidjson::Document &document,
                              std::string_view text) {
    document.Parse(text.data(), text.size());
    if (document.HasParseError()) {
      static auto logger = log::createLogger("Json", "da");
      SL_ERROR(logger,
               "JSON parse error at offset {}: {}",
               document.GetErrorOffset(),
               rapidjson::GetParseError_En(document.GetParseError()));
      return JsonError::PARSE_ERROR;
    }
    if (not document.IsObject()) {
      return JsonError::NOT_AN_OBJECT;
    }
    return outcome::success();
  }

  outcome::result<const rapidjson::Value *> getMember(
      const rapidjson::Value &object, const char *name) {
    if (not object.IsObject()) {
      return JsonError::NOT_AN_OBJECT;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd()) {
      return JsonError::MISSING_FIELD;
    }
    return &it->value;
  }

  outcome::result<uint64_t> getU64(const rapidjson::Value &object,
                                   const char *name) {
    return getU64(object, name, std::numeric_limits<uint64_t>::max());
  }

  outcome::result<uint64_t> getU64(const rapidjson::Value &object,
                                   const char *name,
                                   uint64_t max) {
    OUTCOME_TRY(value, getMember(object, name));
    if (not value->IsUint64()) {
      return JsonError::WRONG_TYPE;
    }
    auto number = value->GetUint64();
    if (number > max) {
      return JsonError::INVALID_NUMBER;
    }
    return number;
  }

  outcome::result<rapidjson::Value::ConstArray> getArray(
      const rapidjson::Value &object, const char *name) {
    OUTCOME_TRY(value, getMember(object, name));
    if (not value->IsArray()) {
      return JsonError::WRONG_TYPE;
    }
    return value->GetArray();
  }

  outcome::result<rapidjson::Value::ConstObject> getObject(
      const rapidjson::Value &object, const char *name) {
    OUTCOME_TRY(value, getMember(object, name));
    if (not value->IsObject()) {
      return JsonError::WRONG_TYPE;
    }
    return value->GetObject();
  }

  outcome::result<uint64_t> parseU64(std::string_view decimal, uint64_t max) {
    uint64_t number = 0;
    const auto *end = decimal.data() + decimal.size();
    auto [ptr, ec] = std::from_chars(decimal.data(), end, number);
    if (ec != std::errc{} or ptr != end or number > max) {
      return JsonError::INVALID_NUMBER;
    }
    return number;
  }

  outcome::result<Stake> parseStake(const rapidjson::Value &value) {
    if (value.IsUint64()) {
      return Stake{value.GetUint64()};
    }
    if (not value.IsString()) {
      return JsonError::WRONG_TYPE;
    }
    std::string_view decimal{value.GetString(), value.GetStringLength()};
    if (decimal.empty() or decimal.size() > 80
        or not std::ranges::all_of(
            decimal, [](char c) { return c >= '0' and c <= '9'; })) {
      return JsonError::INVALID_NUMBER;
    }
    boost::multiprecision::cpp_int stake{std::string{decimal}};
    if (stake > boost::multiprecision::cpp_int{
                    std::numeric_limits<Stake>::max()}) {
      return JsonError::INVALID_NUMBER;
    }
    return Stake{stake};
  }

}  // namespace danode::da::json
