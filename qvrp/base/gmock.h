// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Test-only header: gtest, gmock and Abseil's status matchers.
#ifndef QVRP_BASE_GMOCK_H_
#define QVRP_BASE_GMOCK_H_

#include <utility>

#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "gmock/gmock.h"                  // IWYU pragma: export
#include "gtest/gtest.h"                  // IWYU pragma: export

namespace testing::status {
using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
}  // namespace testing::status

// Binds the value of a StatusOr expression to `lhs`, failing the test on an
// error status.
#define ASSERT_OK_AND_ASSIGN(lhs, rexpr)                                 \
  QVRP_ASSERT_OK_AND_ASSIGN_IMPL_(                                       \
      QVRP_GMOCK_CONCAT_(qvrp_status_or_value_, __LINE__), lhs, rexpr)

#define QVRP_ASSERT_OK_AND_ASSIGN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                    \
  ASSERT_TRUE(statusor.ok()) << statusor.status();            \
  lhs = *std::move(statusor)

#define QVRP_GMOCK_CONCAT_INNER_(x, y) x##y
#define QVRP_GMOCK_CONCAT_(x, y) QVRP_GMOCK_CONCAT_INNER_(x, y)

#endif  // QVRP_BASE_GMOCK_H_
