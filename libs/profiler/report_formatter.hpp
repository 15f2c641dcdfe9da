/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_REPORT_FORMATTER_HPP
#define PERFSCOPE_REPORT_FORMATTER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "profiler/profiler_config.hpp"
#include "profiler/sample.hpp"

namespace perfscope::profiler {

  /**
   * @return duration scaled to the largest of ns, us, ms, s that keeps the
   * value >= 1, e.g. "1.500 ms"
   */
  std::string formatDuration(std::chrono::nanoseconds duration);

  /**
   * @return bytes / elapsed in bytes per second, nullopt when elapsed is not
   * positive
   */
  std::optional<double> bytesPerSecond(uint64_t bytes,
                                       std::chrono::nanoseconds elapsed);

  /// @return rate in B/s, KB/s, MB/s or GB/s with two decimals
  std::string formatThroughput(double bytes_per_second);

  /**
   * Render the sample table: one row per sample in recording order with
   * label, elapsed time, share of total time and throughput. Throughput is
   * blank for samples without bytes or with zero elapsed time.
   */
  std::string formatReport(Report const &report, ProfilerConfig const &config);

  /// Render per-label aggregates, one line per label
  std::string formatSummary(std::vector<LabelSummary> const &summary,
                            std::chrono::nanoseconds total);

}  // namespace perfscope::profiler

#endif  // PERFSCOPE_REPORT_FORMATTER_HPP
