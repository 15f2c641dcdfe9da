/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "profiler/report_formatter.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

namespace {
  static auto constexpr kScaledDuration{FMT_STRING("{:.3f} {}")};
  static auto constexpr kRate{FMT_STRING("{:.2f} {}")};
  static auto constexpr kPercent{FMT_STRING("{:.2f}%")};
  static auto constexpr kTotalLine{FMT_STRING("Total time: {} ({} samples)\n")};
  static auto constexpr kRow{FMT_STRING("{:<{}}  {:>12}  {:>8}")};
  static auto constexpr kThroughputCell{FMT_STRING("  {}")};

  static auto constexpr kSummaryHead{FMT_STRING("  {}[{}]: {}")};
  static auto constexpr kSummaryShare{FMT_STRING(" ({:.2f}%")};
  static auto constexpr kSummaryChildren{FMT_STRING(", {:.2f}% w/children")};
  static auto constexpr kSummaryBandwidth{
      FMT_STRING("  {:.3f}MB at {:.2f}GB/s")};

  constexpr double kKilobyte = 1024.0;
  constexpr double kMegabyte = kKilobyte * 1024.0;
  constexpr double kGigabyte = kMegabyte * 1024.0;

  constexpr char const *kLabelHeader = "label";

  double share(std::chrono::nanoseconds part, std::chrono::nanoseconds total) {
    return 100.0 * static_cast<double>(part.count())
        / static_cast<double>(total.count());
  }

  size_t labelColumnWidth(perfscope::profiler::Report const &report,
                          perfscope::profiler::ProfilerConfig const &config) {
    if (config.label_width != 0) {
      return config.label_width;
    }
    size_t width = std::char_traits<char>::length(kLabelHeader);
    for (auto const &sample : report.samples) {
      width = std::max(width, sample.label.size());
    }
    return width;
  }
}  // namespace

namespace perfscope::profiler {

  std::string formatDuration(std::chrono::nanoseconds duration) {
    auto const ns = duration.count();
    if (ns < 1000) {
      return fmt::format(FMT_STRING("{} ns"), ns);
    }
    auto const value = static_cast<double>(ns);
    if (ns < 1000 * 1000) {
      return fmt::format(kScaledDuration, value / 1e3, "us");
    }
    if (ns < 1000 * 1000 * 1000) {
      return fmt::format(kScaledDuration, value / 1e6, "ms");
    }
    return fmt::format(kScaledDuration, value / 1e9, "s");
  }

  std::optional<double> bytesPerSecond(uint64_t bytes,
                                       std::chrono::nanoseconds elapsed) {
    if (elapsed.count() <= 0) {
      return std::nullopt;
    }
    return static_cast<double>(bytes) * 1e9
        / static_cast<double>(elapsed.count());
  }

  std::string formatThroughput(double bytes_per_second) {
    if (bytes_per_second < kKilobyte) {
      return fmt::format(kRate, bytes_per_second, "B/s");
    }
    if (bytes_per_second < kMegabyte) {
      return fmt::format(kRate, bytes_per_second / kKilobyte, "KB/s");
    }
    if (bytes_per_second < kGigabyte) {
      return fmt::format(kRate, bytes_per_second / kMegabyte, "MB/s");
    }
    return fmt::format(kRate, bytes_per_second / kGigabyte, "GB/s");
  }

  std::string formatReport(Report const &report,
                           ProfilerConfig const &config) {
    fmt::memory_buffer buffer;
    auto out = std::back_inserter(buffer);

    if (config.print_total_time) {
      fmt::format_to(out,
                     kTotalLine,
                     formatDuration(report.total),
                     report.samples.size());
    }

    auto const width = labelColumnWidth(report, config);
    fmt::format_to(out, kRow, kLabelHeader, width, "elapsed", "total");
    fmt::format_to(out, kThroughputCell, "throughput");
    buffer.push_back('\n');

    for (auto const &sample : report.samples) {
      std::string percent;
      if (report.total.count() > 0) {
        percent = fmt::format(kPercent, share(sample.elapsed, report.total));
      }
      fmt::format_to(out,
                     kRow,
                     sample.label,
                     width,
                     formatDuration(sample.elapsed),
                     percent);

      if (sample.bytes) {
        if (auto rate = bytesPerSecond(*sample.bytes, sample.elapsed)) {
          fmt::format_to(out, kThroughputCell, formatThroughput(*rate));
        }
      }
      buffer.push_back('\n');
    }

    return fmt::to_string(buffer);
  }

  std::string formatSummary(std::vector<LabelSummary> const &summary,
                            std::chrono::nanoseconds total) {
    fmt::memory_buffer buffer;
    auto out = std::back_inserter(buffer);

    fmt::format_to(out, FMT_STRING("Summary:\n"));
    for (auto const &entry : summary) {
      fmt::format_to(out,
                     kSummaryHead,
                     entry.label,
                     entry.hit_count,
                     formatDuration(entry.exclusive));

      if (total.count() > 0) {
        fmt::format_to(out, kSummaryShare, share(entry.exclusive, total));
        if (entry.inclusive != entry.exclusive) {
          fmt::format_to(
              out, kSummaryChildren, share(entry.inclusive, total));
        }
        buffer.push_back(')');
      }

      if (entry.bytes > 0 and entry.exclusive.count() > 0) {
        auto const seconds = static_cast<double>(entry.exclusive.count()) / 1e9;
        fmt::format_to(out,
                       kSummaryBandwidth,
                       static_cast<double>(entry.bytes) / kMegabyte,
                       static_cast<double>(entry.bytes) / seconds / kGigabyte);
      }
      buffer.push_back('\n');
    }

    return fmt::to_string(buffer);
  }

}  // namespace perfscope::profiler
