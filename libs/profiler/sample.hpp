/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_PROFILER_SAMPLE_HPP
#define PERFSCOPE_PROFILER_SAMPLE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace perfscope::profiler {

  /**
   * One measurement of an instrumented region.
   */
  struct Sample {
    std::string label;
    /// wall-clock time between region entry and exit
    std::chrono::nanoseconds elapsed{0};
    /// elapsed minus the time of directly nested regions of the same session
    std::chrono::nanoseconds exclusive{0};
    /// bytes processed by the region, if throughput is tracked
    std::optional<uint64_t> bytes;
    /// region was opened inside an open region with the same label
    bool recursive{false};
  };

  /**
   * Everything drained from a session by ProfileSession::end().
   */
  struct Report {
    /// time between begin() and end(), zero for an inactive session
    std::chrono::nanoseconds total{0};
    std::vector<Sample> samples;
  };

  /**
   * Samples of one label aggregated over a session.
   */
  struct LabelSummary {
    std::string label;
    uint64_t hit_count{0};
    /// time including nested regions, recursive hits counted once
    std::chrono::nanoseconds inclusive{0};
    std::chrono::nanoseconds exclusive{0};
    uint64_t bytes{0};
  };

}  // namespace perfscope::profiler

#endif  // PERFSCOPE_PROFILER_SAMPLE_HPP
