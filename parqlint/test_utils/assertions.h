#pragma once

#include <type_traits>
#include <utility>

#include "arrow/result.h"
#include "arrow/status.h"

namespace parqlint::test_internal {

inline const arrow::Status& GetStatus(const arrow::Status& status) { return status; }

template <typename T>
const arrow::Status& GetStatus(const arrow::Result<T>& result) {
  return result.status();
}

}  // namespace parqlint::test_internal

// Accepts arrow::Status and arrow::Result. Prints the status message on failure.
#define ASSERT_OK(expr)                                                                   \
  do {                                                                                    \
    const auto& _assert_ok_status = ::parqlint::test_internal::GetStatus((expr));         \
    ASSERT_TRUE(_assert_ok_status.ok()) << _assert_ok_status.ToString();                  \
  } while (false)

#define EXPECT_OK(expr)                                                                   \
  do {                                                                                    \
    const auto& _expect_ok_status = ::parqlint::test_internal::GetStatus((expr));         \
    EXPECT_TRUE(_expect_ok_status.ok()) << _expect_ok_status.ToString();                  \
  } while (false)

#define ASSIGN_OR_FAIL_IMPL(result_name, lhs, rexpr)                  \
  auto&& result_name = (rexpr);                                       \
  ASSERT_TRUE(result_name.ok()) << result_name.status().ToString();   \
  lhs = std::move(result_name).ValueUnsafe();

#define ASSIGN_OR_FAIL_NAME(x, y) ARROW_CONCAT(x, y)

#define ASSIGN_OR_FAIL(lhs, rexpr) ASSIGN_OR_FAIL_IMPL(ASSIGN_OR_FAIL_NAME(_error_or_value, __COUNTER__), lhs, rexpr);
