/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <set>

#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "da/assignment/impl/assignment_coordinator_impl.hpp"
#include "da/encoding/impl/merkle_encoder.hpp"
#include "da/json/blob_message_reader.hpp"
#include "da/json/json_chain_state.hpp"
#include "da/validation/batch_validator.hpp"
#include "da/validation/impl/chunk_validator_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "utils/thread_pool.hpp"

using danode::application::AppConfiguration;
using danode::application::AppConfigurationImpl;

namespace {
  int run_validator(const AppConfiguration &configuration) {
    namespace da = danode::da;
    auto logger =
        danode::log::createLogger("Main", danode::log::defaultGroupName);

    auto chain_state_res =
        da::JsonChainState::load(configuration.chainStatePath());
    if (chain_state_res.has_error()) {
      SL_ERROR(logger,
               "Can not load chain state from {}: {}",
               configuration.chainStatePath().string(),
               chain_state_res.error());
      return EXIT_FAILURE;
    }
    auto &chain_state = chain_state_res.value();

    std::vector<da::BlobMessage> blobs;
    std::set<da::QuorumId> quorums;
    for (const auto &path : configuration.blobPaths()) {
      auto blob_res = da::loadBlobMessage(path);
      if (blob_res.has_error()) {
        SL_ERROR(logger,
                 "Can not load blob message from {}: {}",
                 path.string(),
                 blob_res.error());
        return EXIT_FAILURE;
      }
      for (const auto &quorum : blob_res.value().header.quorum_infos) {
        quorums.emplace(quorum.security_param.quorum_id);
      }
      blobs.emplace_back(std::move(blob_res.value()));
    }

    da::BlockNumber block_number = 0;
    if (auto block = configuration.referenceBlock()) {
      block_number = *block;
    } else {
      auto current_res = chain_state->getCurrentBlockNumber();
      if (current_res.has_error()) {
        SL_ERROR(logger, "Can not get current block: {}", current_res.error());
        return EXIT_FAILURE;
      }
      block_number = current_res.value();
    }

    auto state_res = chain_state->getOperatorState(
        block_number, {quorums.begin(), quorums.end()});
    if (state_res.has_error()) {
      SL_ERROR(logger,
               "Can not get operator state at block {}: {}",
               block_number,
               state_res.error());
      return EXIT_FAILURE;
    }

    auto encoder = std::make_shared<da::MerkleEncoder>(da::MerkleEncoderConfig{
        .max_blob_length = configuration.maxBlobLength(),
    });
    auto assignment = std::make_shared<da::AssignmentCoordinatorImpl>();
    auto validator = std::make_shared<da::ChunkValidatorImpl>(
        encoder, assignment, configuration.operatorId());
    auto thread_pool = std::make_shared<danode::ThreadPool>(
        "validator", configuration.threads());
    da::BatchValidator batch_validator(validator, thread_pool);

    SL_INFO(logger,
            "Validating {} blobs for operator {:l} at block {}",
            blobs.size(),
            configuration.operatorId(),
            block_number);

    auto results = batch_validator.validateEach(blobs, state_res.value());
    size_t rejected = 0;
    for (size_t i = 0; i < results.size(); ++i) {
      const auto &path = configuration.blobPaths()[i];
      if (results[i].has_value()) {
        SL_INFO(logger, "Blob {} accepted", path.string());
      } else {
        ++rejected;
        SL_WARN(logger,
                "Blob {} rejected: {}",
                path.string(),
                results[i].error());
      }
    }

    SL_INFO(logger,
            "{} of {} blobs accepted",
            results.size() - rejected,
            results.size());
    logger->flush();

    return rejected == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  soralog::util::setThreadName("danode");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        danode::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<danode::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<danode::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  danode::log::setLoggingSystem(logging_system);

  auto configuration = std::make_shared<AppConfigurationImpl>(
      danode::log::createLogger("AppConfiguration", "application"));
  if (not configuration->initializeFromArgs(argc, argv)) {
    return EXIT_FAILURE;
  }

  if (auto res = danode::log::tuneLoggingSystem(configuration->log());
      res.has_error()) {
    std::cerr << "Wrong logging option: " << res.error().message() << '\n';
    return EXIT_FAILURE;
  }

  return run_validator(*configuration);
}
