/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_PROFILE_SESSION_HPP
#define PERFSCOPE_PROFILE_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "logger/logger.hpp"
#include "profiler/profiler_config.hpp"
#include "profiler/sample.hpp"

namespace perfscope::profiler {

  /**
   * Accumulates samples between begin() and end(). Samples recorded while the
   * session is inactive are dropped. All members may be called from any
   * thread: appends and the begin/end reset are serialized by an internal
   * mutex. No member throws; failures are logged and degrade to a missing
   * sample or an incomplete report.
   */
  class ProfileSession final {
   public:
    using Clock = std::chrono::steady_clock;

    static constexpr char const *kUnnamedLabel = "<unnamed>";

    /**
     * @param config report and capacity settings, replaced by defaults if
     * invalid
     * @param out stream endAndPrint() writes to
     * @param log logger, a child of the default logger manager if null
     */
    explicit ProfileSession(ProfilerConfig config = {},
                            std::ostream &out = std::cout,
                            logger::LoggerPtr log = nullptr);

    ProfileSession(ProfileSession const &) = delete;
    ProfileSession &operator=(ProfileSession const &) = delete;

    ProfileSession(ProfileSession &&) = delete;
    ProfileSession &operator=(ProfileSession &&) = delete;

    ~ProfileSession() = default;

    /**
     * Start accepting samples. Calling it on an active session restarts the
     * session and discards the samples not yet reported.
     */
    void begin();

    void record(std::string label,
                std::chrono::nanoseconds elapsed,
                std::optional<uint64_t> bytes = std::nullopt);

    /// Append a sample with nesting information, used by Region
    void record(Sample sample);

    /**
     * Stop the session and hand over its samples
     * @return total session time and samples in recording order, empty if
     * the session was not active
     */
    Report end();

    /// end() and write the report to the output stream
    void endAndPrint();

    bool isActive() const;

    size_t sampleCount() const;

    ProfilerConfig const &config() const;

    /**
     * Aggregate samples by label in order of first appearance
     */
    static std::vector<LabelSummary> summarize(
        std::vector<Sample> const &samples);

   private:
    ProfilerConfig config_;
    std::ostream &out_;
    logger::LoggerPtr log_;

    mutable std::mutex mutex_;
    bool active_{false};
    Clock::time_point start_time_;
    std::vector<Sample> samples_;
  };

}  // namespace perfscope::profiler

#endif  // PERFSCOPE_PROFILE_SESSION_HPP
