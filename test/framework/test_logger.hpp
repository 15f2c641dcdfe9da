/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_TEST_LOGGER_HPP
#define PERFSCOPE_TEST_LOGGER_HPP

#include <string>

#include "logger/logger.hpp"

/// @return logger manager for test code, tagged "test"
perfscope::logger::LoggerManagerPtr &getTestLoggerManager(
    perfscope::logger::LogLevel level = perfscope::logger::LogLevel::kDebug);

/// @return a child of the test logger manager
perfscope::logger::LoggerPtr getTestLogger(std::string const &tag);

#endif  // PERFSCOPE_TEST_LOGGER_HPP
