/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace danode::log {

  /// soralog configurator with the danode group tree embedded
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);

    /// Finds `--logcfg <path>` among the arguments, if any
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace danode::log
