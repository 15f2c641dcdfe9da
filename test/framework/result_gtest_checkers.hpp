/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef PERFSCOPE_RESULT_GTEST_CHECKERS_HPP
#define PERFSCOPE_RESULT_GTEST_CHECKERS_HPP

#include <gtest/gtest.h>

#include "common/result.hpp"

namespace framework::expected {

  template <typename V, typename E>
  ::testing::AssertionResult resultHasValue(
      perfscope::expected::Result<V, E> const &result) {
    if (result.hasValue()) {
      return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure()
        << "Value expected, but got error: " << result.assumeError();
  }

  template <typename V, typename E>
  ::testing::AssertionResult resultHasError(
      perfscope::expected::Result<V, E> const &result) {
    if (result.hasError()) {
      return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << "Error expected, but got value.";
  }

}  // namespace framework::expected

#define PERFSCOPE_ASSERT_RESULT_VALUE(result) \
  ASSERT_TRUE(::framework::expected::resultHasValue(result))

#define PERFSCOPE_EXPECT_RESULT_VALUE(result) \
  EXPECT_TRUE(::framework::expected::resultHasValue(result))

#define PERFSCOPE_ASSERT_RESULT_ERROR(result) \
  ASSERT_TRUE(::framework::expected::resultHasError(result))

#define PERFSCOPE_EXPECT_RESULT_ERROR(result) \
  EXPECT_TRUE(::framework::expected::resultHasError(result))

#endif  // PERFSCOPE_RESULT_GTEST_CHECKERS_HPP
