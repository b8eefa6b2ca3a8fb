//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#define NOLINT_TEST(ts, name) TEST(ts, name) // NOLINT
#define NOLINT_TEST_F(ts, name) TEST_F(ts, name) // NOLINT
#define NOLINT_TEST_P(ts, name) TEST_P(ts, name) // NOLINT
#define NOLINT_ASSERT_THROW(st, ex) ASSERT_THROW(st, ex) // NOLINT
#define NOLINT_EXPECT_THROW(st, ex) EXPECT_THROW(st, ex) // NOLINT
#define NOLINT_ASSERT_NO_THROW(st) ASSERT_NO_THROW(st) // NOLINT
#define NOLINT_EXPECT_NO_THROW(st) EXPECT_NO_THROW(st) // NOLINT

// Run `statement` and bind the exception it throws to `var` for further
// checks. Fails the test if nothing, or another type, is thrown. Example:
//   CAPTURE_THROW(registry->Resolve("work", {}), MissingFieldError, error);
//   EXPECT_EQ(error.Field(), "Asset");
#define CAPTURE_THROW(statement, exception_type, var)                          \
  std::optional<exception_type> var##_holder;                                  \
  try {                                                                        \
    statement;                                                                 \
  } catch (const exception_type& ex) {                                         \
    var##_holder.emplace(ex);                                                  \
  }                                                                            \
  ASSERT_TRUE(var##_holder.has_value())                                        \
    << "expected " #exception_type " from: " #statement;                       \
  const exception_type& var = *var##_holder // NOLINT
