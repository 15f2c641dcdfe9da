/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "profiler/profile_session.hpp"

#include <algorithm>
#include <unordered_map>

#include "profiler/report_formatter.hpp"

namespace {
  void normalize(perfscope::profiler::Sample &sample) {
    using std::chrono::nanoseconds;
    if (sample.label.empty()) {
      sample.label = perfscope::profiler::ProfileSession::kUnnamedLabel;
    }
    sample.elapsed = std::max(sample.elapsed, nanoseconds::zero());
    sample.exclusive =
        std::clamp(sample.exclusive, nanoseconds::zero(), sample.elapsed);
  }
}  // namespace

namespace perfscope::profiler {

  ProfileSession::ProfileSession(ProfilerConfig config,
                                 std::ostream &out,
                                 logger::LoggerPtr log)
      : config_(std::move(config)),
        out_(out),
        log_(log ? std::move(log)
                 : logger::getDefaultLoggerManager()
                       ->getChild("ProfileSession")
                       ->getLogger()) {
    if (auto result = validateConfig(config_); result.hasError()) {
      log_->warn("Invalid profiler config, using defaults: {}",
                 result.assumeError());
      config_ = ProfilerConfig{};
    }
  }

  void ProfileSession::begin() {
    size_t discarded = 0;
    try {
      std::lock_guard<std::mutex> lock(mutex_);
      discarded = samples_.size();
      samples_.clear();
      samples_.reserve(config_.initial_capacity);
      active_ = true;
      start_time_ = Clock::now();
    } catch (std::exception const &e) {
      log_->error("Failed to prepare profiling session: {}", e.what());
      return;
    }

    if (discarded > 0) {
      log_->debug("Session restarted, discarding {} unreported samples",
                  discarded);
    } else {
      log_->debug("Session started");
    }
  }

  void ProfileSession::record(std::string label,
                              std::chrono::nanoseconds elapsed,
                              std::optional<uint64_t> bytes) {
    record(Sample{std::move(label), elapsed, elapsed, bytes, false});
  }

  void ProfileSession::record(Sample sample) {
    try {
      normalize(sample);
      std::lock_guard<std::mutex> lock(mutex_);
      if (not active_) {
        return;
      }
      samples_.push_back(std::move(sample));
    } catch (std::exception const &e) {
      log_->error("Failed to record sample: {}", e.what());
    }
  }

  Report ProfileSession::end() {
    Report report;
    try {
      std::lock_guard<std::mutex> lock(mutex_);
      if (active_) {
        report.total = std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now() - start_time_);
        report.samples = std::move(samples_);
      }
      samples_.clear();
      active_ = false;
    } catch (std::exception const &e) {
      log_->error("Failed to end profiling session: {}", e.what());
      return report;
    }

    log_->debug("Session ended with {} samples", report.samples.size());
    return report;
  }

  void ProfileSession::endAndPrint() {
    auto const report = end();
    try {
      auto text = formatReport(report, config_);
      if (config_.print_summary) {
        text += formatSummary(summarize(report.samples), report.total);
      }
      out_ << text << std::flush;
    } catch (std::exception const &e) {
      log_->error("Failed to print profiling report: {}", e.what());
    }
  }

  bool ProfileSession::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
  }

  size_t ProfileSession::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
  }

  ProfilerConfig const &ProfileSession::config() const {
    return config_;
  }

  std::vector<LabelSummary> ProfileSession::summarize(
      std::vector<Sample> const &samples) {
    std::vector<LabelSummary> summary;
    std::unordered_map<std::string, size_t> index;

    for (auto const &sample : samples) {
      auto [it, inserted] = index.emplace(sample.label, summary.size());
      if (inserted) {
        summary.push_back(LabelSummary{sample.label});
      }

      auto &entry = summary[it->second];
      ++entry.hit_count;
      entry.exclusive += sample.exclusive;
      if (not sample.recursive) {
        entry.inclusive += sample.elapsed;
      }
      entry.bytes += sample.bytes.value_or(0);
    }
    return summary;
  }

}  // namespace perfscope::profiler
