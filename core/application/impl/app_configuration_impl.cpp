/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>
#include <limits>

#include <boost/program_options.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }
}  // namespace

namespace danode::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        threads_(kDefaultThreads),
        max_blob_length_(kDefaultMaxBlobLength) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u64(const rapidjson::Value &val,
                                      const char *name,
                                      uint64_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint64()) {
      target = m->value.GetUint64();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_str_list(const rapidjson::Value &val,
                                           const char *name,
                                           std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsString()) {
      target.emplace_back(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    if (not m->value.IsArray()) {
      return false;
    }
    for (const auto &item : m->value.GetArray()) {
      if (not item.IsString()) {
        return false;
      }
      target.emplace_back(item.GetString(), item.GetStringLength());
    }
    return true;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_str_list(val, "log", logger_tuning_config_);
  }

  void AppConfigurationImpl::parse_validator_segment(
      const rapidjson::Value &val) {
    load_str(val, "operator-id", operator_id_str_);

    std::string chain_state;
    if (load_str(val, "chain-state", chain_state)) {
      chain_state_path_ = chain_state;
    }

    std::vector<std::string> blobs;
    if (load_str_list(val, "blobs", blobs)) {
      blob_paths_.assign(blobs.begin(), blobs.end());
    }

    uint32_t block = 0;
    if (load_u32(val, "block-number", block)) {
      reference_block_ = block;
    }

    uint32_t threads = 0;
    if (load_u32(val, "threads", threads)) {
      threads_ = threads;
    }

    load_u64(val, "max-blob-length", max_blob_length_);
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer{};
    FileReadStream input_stream(file.get(), buffer.data(), buffer.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not an object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::set_operator_id(const std::string &hex) {
    auto id_res = da::OperatorId::fromHexWithPrefix(hex);
    if (id_res.has_error()) {
      SL_ERROR(logger_,
               "Operator id '{}' is not a 0x-prefixed 32-byte hex: {}",
               hex,
               id_res.error());
      return false;
    }
    operator_id_ = id_res.value();
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lchunk_validator=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The level of all danode groups can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath to a soralog YAML configuration.")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description validator_desc("Validator options");
    validator_desc.add_options()
        ("operator-id", po::value<std::string>(), "required, 0x-prefixed 32-byte id of the operator to validate chunks for")
        ("chain-state", po::value<std::string>(), "required, JSON file with the operator state snapshot")
        ("blob", po::value<std::vector<std::string>>()->multitoken(), "JSON file with a blob message, may be repeated")
        ("block-number", po::value<uint32_t>(), "reference block of the operator state, the current block by default")
        ("threads", po::value<uint32_t>()->default_value(kDefaultThreads), "number of threads blobs are validated on")
        ("max-blob-length", po::value<uint64_t>()->default_value(kDefaultMaxBlobLength), "largest accepted blob length in symbols")
        ;
    // clang-format on

    desc.add(validator_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << "Usage: danode --operator-id <0x..> --chain-state <file> "
                   "--blob <file>...\n";
      std::cout << desc << std::endl;
      return false;
    }

    bool ok = true;
    find_argument<std::string>(vm, "config-file", [&](const std::string &path) {
      ok = read_config_from_file(path);
    });
    if (not ok) {
      return false;
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_.insert(
              logger_tuning_config_.end(), val.begin(), val.end());
        });

    find_argument<std::string>(
        vm, "operator-id", [&](const std::string &val) {
          operator_id_str_ = val;
        });
    find_argument<std::string>(
        vm, "chain-state", [&](const std::string &val) {
          chain_state_path_ = val;
        });
    find_argument<std::vector<std::string>>(
        vm, "blob", [&](const std::vector<std::string> &val) {
          blob_paths_.assign(val.begin(), val.end());
        });
    find_argument<uint32_t>(
        vm, "block-number", [&](uint32_t val) { reference_block_ = val; });
    find_argument<uint32_t>(vm, "threads", [&](uint32_t val) { threads_ = val; });
    find_argument<uint64_t>(
        vm, "max-blob-length", [&](uint64_t val) { max_blob_length_ = val; });

    if (operator_id_str_.empty()) {
      SL_ERROR(logger_, "Operator id is not provided, use --operator-id");
      return false;
    }
    if (not set_operator_id(operator_id_str_)) {
      return false;
    }
    if (chain_state_path_.empty()) {
      SL_ERROR(logger_, "Chain state is not provided, use --chain-state");
      return false;
    }
    if (threads_ == 0) {
      SL_ERROR(logger_, "Number of threads must be positive");
      return false;
    }
    if (max_blob_length_ == 0) {
      SL_ERROR(logger_, "Maximum blob length must be positive");
      return false;
    }
    if (blob_paths_.empty()) {
      SL_WARN(logger_, "No blob messages provided, nothing to validate");
    }

    return true;
  }

}  // namespace danode::application
