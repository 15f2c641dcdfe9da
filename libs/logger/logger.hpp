/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_LOGGER_HPP
#define PERFSCOPE_LOGGER_HPP

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace perfscope::logger {

  using Logger = spdlog::logger;
  using LoggerPtr = std::shared_ptr<Logger>;

  enum class LogLevel { kTrace, kDebug, kInfo, kWarn, kError, kCritical };

  spdlog::level::level_enum toSpdlogLevel(LogLevel level);

  class LoggerManager;
  using LoggerManagerPtr = std::shared_ptr<LoggerManager>;

  /**
   * Hands out loggers named after a dotted tag hierarchy, e.g.
   * "perfscope.ProfileSession". Children inherit the parent's level.
   */
  class LoggerManager {
   public:
    LoggerManager(std::string tag, LogLevel level);

    LoggerManager(LoggerManager const &) = delete;
    LoggerManager &operator=(LoggerManager const &) = delete;

    /// @return manager for a sub-component, tagged "<this tag>.<tag>"
    LoggerManagerPtr getChild(std::string const &tag) const;

    /// @return logger for this tag, created on first use
    LoggerPtr getLogger();

    std::string const &getTag() const;

    LogLevel getLevel() const;

   private:
    std::string const tag_;
    LogLevel const level_;
    std::mutex mutex_;
    LoggerPtr logger_;
  };

  /// Root manager used by components constructed without an explicit logger.
  LoggerManagerPtr getDefaultLoggerManager();

}  // namespace perfscope::logger

#endif  // PERFSCOPE_LOGGER_HPP
