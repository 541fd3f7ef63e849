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

#ifndef QVRP_BASE_STATUS_MACROS_H_
#define QVRP_BASE_STATUS_MACROS_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Returns from the enclosing function with the status of `expr` if it is not
// OK. `expr` must evaluate to an absl::Status.
//
//   RETURN_IF_ERROR(ValidateProblem(problem));
#define RETURN_IF_ERROR(expr)                                  \
  do {                                                         \
    ::absl::Status qvrp_status_macros_status_ = (expr);        \
    if (!qvrp_status_macros_status_.ok()) {                    \
      return qvrp_status_macros_status_;                       \
    }                                                          \
  } while (false)

// Evaluates `rexpr`, an absl::StatusOr<T>, and either moves its value into
// `lhs` or returns its error status from the enclosing function. `lhs` may
// declare a variable:
//
//   ASSIGN_OR_RETURN(const QuboMatrix qubo, VrpToQubo(problem, penalty));
//
// The macro expands to several statements, so it cannot be the unbraced body
// of an if or a loop.
#define ASSIGN_OR_RETURN(lhs, rexpr)                                       \
  QVRP_ASSIGN_OR_RETURN_IMPL_(                                             \
      QVRP_STATUS_MACROS_CONCAT_(qvrp_status_or_, __LINE__), lhs, rexpr)

#define QVRP_ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                \
  if (!statusor.ok()) return std::move(statusor).status(); \
  lhs = *std::move(statusor)

#define QVRP_STATUS_MACROS_CONCAT_INNER_(x, y) x##y
#define QVRP_STATUS_MACROS_CONCAT_(x, y) QVRP_STATUS_MACROS_CONCAT_INNER_(x, y)

#endif  // QVRP_BASE_STATUS_MACROS_H_
