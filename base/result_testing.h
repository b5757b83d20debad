// base/result_testing.h - Macros for checking base::Result values in tests
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_RESULT_TESTING_H
#define BASE_RESULT_TESTING_H

#include <cstdint>

#include "base/result.h"
#include "gtest/gtest.h"

namespace base {
namespace testing {

// Predicate formatter: passes iff |expr| carries the result code |code|.
inline ::testing::AssertionResult ResultCodeEQ(const char* code_text,
                                               const char* expr_text,
                                               Result::Code code,
                                               const Result& expr) {
  if (code == expr.code()) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure()
         << expr_text << "\n"
         << "  expected: " << code << " ("
         << static_cast<unsigned int>(static_cast<uint8_t>(code)) << ")\n"
         << "    actual: " << expr.as_string();
}

}  // namespace testing
}  // namespace base

#define BASE_RESULT_ASSERT(code, x)                  \
  ASSERT_PRED_FORMAT2(::base::testing::ResultCodeEQ, \
                      ::base::Result::Code::code, x)

#define BASE_RESULT_EXPECT(code, x)                  \
  EXPECT_PRED_FORMAT2(::base::testing::ResultCodeEQ, \
                      ::base::Result::Code::code, x)

#define ASSERT_OK(x) BASE_RESULT_ASSERT(OK, x)
#define ASSERT_INVALID_ARGUMENT(x) BASE_RESULT_ASSERT(INVALID_ARGUMENT, x)
#define ASSERT_NOT_IMPLEMENTED(x) BASE_RESULT_ASSERT(NOT_IMPLEMENTED, x)

#define EXPECT_OK(x) BASE_RESULT_EXPECT(OK, x)
#define EXPECT_UNKNOWN(x) BASE_RESULT_EXPECT(UNKNOWN, x)
#define EXPECT_NOT_FOUND(x) BASE_RESULT_EXPECT(NOT_FOUND, x)
#define EXPECT_WRONG_TYPE(x) BASE_RESULT_EXPECT(WRONG_TYPE, x)
#define EXPECT_PERMISSION_DENIED(x) BASE_RESULT_EXPECT(PERMISSION_DENIED, x)
#define EXPECT_INVALID_ARGUMENT(x) BASE_RESULT_EXPECT(INVALID_ARGUMENT, x)
#define EXPECT_OUT_OF_RANGE(x) BASE_RESULT_EXPECT(OUT_OF_RANGE, x)
#define EXPECT_NOT_IMPLEMENTED(x) BASE_RESULT_EXPECT(NOT_IMPLEMENTED, x)
#define EXPECT_DATA_LOSS(x) BASE_RESULT_EXPECT(DATA_LOSS, x)

#endif  // BASE_RESULT_TESTING_H
