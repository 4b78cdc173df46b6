/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "outcome/outcome.hpp"

namespace danode {

  template <typename T>
  concept CharContainer =  //
      requires(T t, std::streampos pos) {
        { t.data() } -> std::convertible_to<const char *>;
        { t.size() } -> std::convertible_to<std::streamsize>;
        { t.resize(pos) };
        { t.clear() };
      };

  template <CharContainer Out>
  outcome::result<void> readFile(Out &out, const std::filesystem::path &path) {
    std::ifstream file{path, std::ios::binary | std::ios::ate};
    if (not file.good()) {
      out.clear();
      return std::errc{errno};
    }
    out.resize(file.tellg());
    file.seekg(0);
    file.read(out.data(), static_cast<std::streamsize>(out.size()));
    if (not file.good()) {
      out.clear();
      return std::errc{errno};
    }
    return outcome::success();
  }

  inline outcome::result<std::string> readText(
      const std::filesystem::path &path) {
    std::string text;
    OUTCOME_TRY(readFile(text, path));
    return text;
  }
}  // namespace danode
