/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_PROFILER_CONFIG_HPP
#define PERFSCOPE_PROFILER_CONFIG_HPP

#include <cstddef>
#include <string>

#include "common/result.hpp"

namespace perfscope::profiler {

  struct ProfilerConfig {
    static constexpr size_t kMaxInitialCapacity = 1u << 20;
    static constexpr size_t kMaxLabelWidth = 256;

    /// print "Total time: ..." before the sample table
    bool print_total_time = true;
    /// append per-label aggregates after the sample table
    bool print_summary = false;
    /// samples reserved on begin()
    size_t initial_capacity = 4096;
    /// width of the label column, 0 fits the longest label
    size_t label_width = 0;
  };

  /**
   * Check config bounds
   * @param config to check
   * @return error message describing the first invalid field
   */
  expected::Result<void, std::string> validateConfig(
      ProfilerConfig const &config);

}  // namespace perfscope::profiler

#endif  // PERFSCOPE_PROFILER_CONFIG_HPP
