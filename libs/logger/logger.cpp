/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

  auto constexpr kLogPattern{"[%Y-%m-%d %H:%M:%S.%F][th:%t][%=8l][%n]: %v"};
  auto constexpr kRootTag{"perfscope"};

  spdlog::sink_ptr getConsoleSink() {
    static spdlog::sink_ptr const sink = [] {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      sink->set_pattern(kLogPattern);
      return sink;
    }();
    return sink;
  }

}  // namespace

namespace perfscope::logger {

  spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
      case LogLevel::kTrace:
        return spdlog::level::trace;
      case LogLevel::kDebug:
        return spdlog::level::debug;
      case LogLevel::kInfo:
        return spdlog::level::info;
      case LogLevel::kWarn:
        return spdlog::level::warn;
      case LogLevel::kError:
        return spdlog::level::err;
      case LogLevel::kCritical:
        return spdlog::level::critical;
    }
    return spdlog::level::info;
  }

  LoggerManager::LoggerManager(std::string tag, LogLevel level)
      : tag_(std::move(tag)), level_(level) {}

  LoggerManagerPtr LoggerManager::getChild(std::string const &tag) const {
    return std::make_shared<LoggerManager>(fmt::format("{}.{}", tag_, tag),
                                           level_);
  }

  LoggerPtr LoggerManager::getLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (not logger_) {
      logger_ = std::make_shared<spdlog::logger>(tag_, getConsoleSink());
      logger_->set_level(toSpdlogLevel(level_));
    }
    return logger_;
  }

  std::string const &LoggerManager::getTag() const {
    return tag_;
  }

  LogLevel LoggerManager::getLevel() const {
    return level_;
  }

  LoggerManagerPtr getDefaultLoggerManager() {
    static LoggerManagerPtr const manager =
        std::make_shared<LoggerManager>(kRootTag, LogLevel::kInfo);
    return manager;
  }

}  // namespace perfscope::logger
