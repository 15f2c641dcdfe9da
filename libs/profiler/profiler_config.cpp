/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "profiler/profiler_config.hpp"

#include <fmt/format.h>

using namespace perfscope::expected;

namespace perfscope::profiler {

  Result<void, std::string> validateConfig(ProfilerConfig const &config) {
    if (config.initial_capacity > ProfilerConfig::kMaxInitialCapacity) {
      return makeError(
          fmt::format("initial_capacity {} exceeds maximum {}",
                      config.initial_capacity,
                      ProfilerConfig::kMaxInitialCapacity));
    }
    if (config.label_width > ProfilerConfig::kMaxLabelWidth) {
      return makeError(fmt::format("label_width {} exceeds maximum {}",
                                   config.label_width,
                                   ProfilerConfig::kMaxLabelWidth));
    }
    return Value<void>{};
  }

}  // namespace perfscope::profiler
