/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef PERFSCOPE_PROFILER_HPP
#define PERFSCOPE_PROFILER_HPP

#include "profiler/profile_session.hpp"
#include "profiler/region.hpp"

#ifndef PERFSCOPE_PROFILING_ENABLED
#define PERFSCOPE_PROFILING_ENABLED 1
#endif

namespace perfscope::profiler {

  /// Process-wide session, created on first use, reporting to std::cout.
  ProfileSession &globalSession();

  /**
   * Begin profiling on the global session. Call it at the start of main or
   * wherever the profiling timestamp should begin.
   */
  void profileBegin();

  /// End profiling on the global session and print its report.
  void profileEndAndPrint();

}  // namespace perfscope::profiler

#define PERFSCOPE_PROFILER_CONCAT_(a, b) a##b
#define PERFSCOPE_PROFILER_CONCAT(a, b) PERFSCOPE_PROFILER_CONCAT_(a, b)
#define PERFSCOPE_PROFILER_REGION(...)                         \
  ::perfscope::profiler::Region PERFSCOPE_PROFILER_CONCAT(     \
      perfscope_profile_region_, __LINE__)(                    \
      ::perfscope::profiler::globalSession(), __VA_ARGS__)

#if PERFSCOPE_PROFILING_ENABLED
#define PERFSCOPE_PROFILE_FUNCTION() PERFSCOPE_PROFILER_REGION(__func__)
#define PERFSCOPE_PROFILE_BLOCK(label) PERFSCOPE_PROFILER_REGION(label)
#define PERFSCOPE_PROFILE_BANDWIDTH(label, bytes) \
  PERFSCOPE_PROFILER_REGION(label, static_cast<uint64_t>(bytes))
#else
#define PERFSCOPE_PROFILE_FUNCTION()
#define PERFSCOPE_PROFILE_BLOCK(label)
#define PERFSCOPE_PROFILE_BANDWIDTH(label, bytes)
#endif

#endif  // PERFSCOPE_PROFILER_HPP
