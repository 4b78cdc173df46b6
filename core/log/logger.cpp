/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(danode::log, Error, e) {
  using E = danode::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::WRONG_TUNING:
      return "Log tuning entry must be <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace danode::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem>
    ensure_logger_system_is_initialized() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(
          logging_system,
          "Logging system is not ready. "
          "danode::log::setLoggingSystem() must be executed once before");
      return logging_system;
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &cfg) {
    auto logging_system = ensure_logger_system_is_initialized();

    for (const auto &entry : cfg) {
      if (auto res = str2lvl(entry); res.has_value()) {
        logging_system->setLevelOfGroup(defaultGroupName, res.value());
        continue;
      }

      auto eq = entry.find('=');
      if (eq == std::string::npos or eq == 0) {
        return Error::WRONG_TUNING;
      }
      std::string group_name = entry.substr(0, eq);
      if (not logging_system->getGroup(group_name)) {
        return Error::WRONG_GROUP;
      }
      OUTCOME_TRY(level, str2lvl(std::string_view{entry}.substr(eq + 1)));
      logging_system->setLevelOfGroup(group_name, level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    auto logging_system = ensure_logger_system_is_initialized();
    return std::static_pointer_cast<soralog::LoggerFactory>(logging_system)
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    auto logging_system = ensure_logger_system_is_initialized();
    return logging_system->setLevelOfGroup(group_name, level);
  }

}  // namespace danode::log
