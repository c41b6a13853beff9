/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

namespace testutil {
  inline std::string errorMessage(const std::error_code &ec) {
    return ec.message();
  }

  /// Error types with ADL make_error_code
  template <typename E>
  std::string errorMessage(const E &e) {
    return make_error_code(e).message();
  }
}  // namespace testutil

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_CAT(a, b) a##b
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_NAME(a, b) _EXPECT_OUTCOME_CAT(a, b)

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE(var, val, expr)                      \
  auto &&var = expr;                                              \
  ASSERT_TRUE(var.has_value())                                    \
      << "Line " << __LINE__ << ": "                              \
      << ::testutil::errorMessage(var.error());                   \
  auto &&val = var.value();

/**
 * Expect result holds value and bind it to `val`
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  _EXPECT_OUTCOME_TRUE(_EXPECT_OUTCOME_NAME(_r_, __LINE__), val, expr)

/**
 * Expect result holds value
 */
#define EXPECT_OUTCOME_TRUE_1(expr)                                     \
  {                                                                     \
    auto &&_r = expr;                                                   \
    EXPECT_TRUE(_r.has_value())                                         \
        << "Line " << __LINE__ << ": "                                  \
        << ::testutil::errorMessage(_r.error());                        \
  }

/**
 * Expect result holds error
 */
#define EXPECT_OUTCOME_FALSE_1(expr)                            \
  {                                                             \
    auto &&_r = expr;                                           \
    EXPECT_FALSE(_r.has_value()) << "Line " << __LINE__;        \
  }

/**
 * Expect result holds given error
 */
#define EXPECT_OUTCOME_ERROR(error, expr)                              \
  {                                                                    \
    auto &&_r = expr;                                                  \
    ASSERT_FALSE(_r.has_value()) << "Line " << __LINE__;               \
    EXPECT_EQ(_r.error(), error);                                      \
  }
