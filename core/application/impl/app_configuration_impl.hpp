/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace danode::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * @return false if the application should exit, either because of wrong
     * arguments or because help was printed
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const da::OperatorId &operatorId() const override {
      return operator_id_;
    }
    const std::filesystem::path &chainStatePath() const override {
      return chain_state_path_;
    }
    const std::vector<std::filesystem::path> &blobPaths() const override {
      return blob_paths_;
    }
    std::optional<da::BlockNumber> referenceBlock() const override {
      return reference_block_;
    }
    size_t threads() const override {
      return threads_;
    }
    uint64_t maxBlobLength() const override {
      return max_blob_length_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_validator_segment(const rapidjson::Value &val);

    static FilePtr open_file(const std::string &filepath);

    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);
    bool load_u64(const rapidjson::Value &val,
                  const char *name,
                  uint64_t &target);
    bool load_str_list(const rapidjson::Value &val,
                       const char *name,
                       std::vector<std::string> &target);

    bool read_config_from_file(const std::string &filepath);

    bool set_operator_id(const std::string &hex);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general",   std::bind(&AppConfigurationImpl::parse_general_segment, this, std::placeholders::_1)},
        SegmentHandler{"validator", std::bind(&AppConfigurationImpl::parse_validator_segment, this, std::placeholders::_1)},
    };
    // clang-format on

    log::Logger logger_;

    std::string operator_id_str_;
    da::OperatorId operator_id_;
    std::filesystem::path chain_state_path_;
    std::vector<std::filesystem::path> blob_paths_;
    std::optional<da::BlockNumber> reference_block_;
    size_t threads_;
    uint64_t max_blob_length_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace danode::application
