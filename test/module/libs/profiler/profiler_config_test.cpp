/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "profiler/profiler_config.hpp"

#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_logger.hpp"
#include "profiler/profile_session.hpp"

using namespace perfscope::profiler;

using testing::HasSubstr;

TEST(ProfilerConfigTest, DefaultsAreValid) {
  PERFSCOPE_ASSERT_RESULT_VALUE(validateConfig(ProfilerConfig{}));
}

TEST(ProfilerConfigTest, BoundsAreInclusive) {
  ProfilerConfig config;
  config.initial_capacity = ProfilerConfig::kMaxInitialCapacity;
  config.label_width = ProfilerConfig::kMaxLabelWidth;

  PERFSCOPE_ASSERT_RESULT_VALUE(validateConfig(config));
}

TEST(ProfilerConfigTest, RejectsHugeInitialCapacity) {
  ProfilerConfig config;
  config.initial_capacity = ProfilerConfig::kMaxInitialCapacity + 1;

  auto const result = validateConfig(config);

  PERFSCOPE_ASSERT_RESULT_ERROR(result);
  EXPECT_THAT(result.assumeError(), HasSubstr("initial_capacity"));
}

TEST(ProfilerConfigTest, RejectsWideLabelColumn) {
  ProfilerConfig config;
  config.label_width = ProfilerConfig::kMaxLabelWidth + 1;

  auto const result = validateConfig(config);

  PERFSCOPE_ASSERT_RESULT_ERROR(result);
  EXPECT_THAT(result.assumeError(), HasSubstr("label_width"));
}

/**
 * @given an invalid config
 * @when a session is constructed with it
 * @then the session falls back to the default config
 */
TEST(ProfilerConfigTest, SessionFallsBackToDefaults) {
  std::ostringstream out;
  ProfilerConfig config;
  config.print_summary = true;
  config.label_width = ProfilerConfig::kMaxLabelWidth + 1;

  ProfileSession session{config, out, getTestLogger("ProfileSession")};

  EXPECT_FALSE(session.config().print_summary);
  EXPECT_EQ(session.config().label_width, 0u);
  EXPECT_EQ(session.config().initial_capacity, ProfilerConfig{}.initial_capacity);
}
