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

// Reformulation of a vehicle routing problem as a Quadratic Unconstrained
// Binary Optimization (QUBO) problem.
//
// The QUBO has one binary variable x[i,j,k] per ordered node pair (i, j) and
// vehicle k, laid out by QuboVariableIndex. Its matrix Q is the sum of:
//
// 1. The travel cost: d[i][j] on the diagonal of x[i,j,k], for i != j.
// 2. "Every customer j is entered exactly once": the expansion of
//    penalty * (sum_{i,k} x[i,j,k] - 1)^2, i.e. -penalty on the diagonal of
//    each x[i,j,k] and +2 * penalty between every two distinct variables
//    sharing destination j. The depot is exempt.
// 3. "Every customer i is left exactly once": the same expansion over the
//    variables x[i,j,k] with j != i sharing origin i. The depot is exempt.
// 4. Flow continuity through every customer m, for every vehicle k: for each
//    incoming x[i,m,k] (i != m) and outgoing x[m,j,k] (j != m), +penalty on
//    both diagonals and -2 * penalty on the (incoming, outgoing) entry.
//
// All contributions are accumulated into Q, which is not symmetrized.
#ifndef QVRP_QUBO_VRP_ENCODER_H_
#define QVRP_QUBO_VRP_ENCODER_H_

#include <cstdint>

#include "absl/status/statusor.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/routing/types.h"

namespace qvrp {

// Large relative to the typical distances of generated problems, so that the
// constraint terms dominate the travel cost.
inline constexpr double kDefaultPenalty = 10.0;

// The QUBO matrix is dense: n^2 * v variables need (n^2 * v)^2 doubles. Larger
// problems are rejected with a ResourceExhausted error.
inline constexpr int64_t kMaxQuboVariables = 4096;

// Builds the QUBO matrix of `problem`. Returns an InvalidArgument error when
// the problem is malformed or `penalty` is not a positive finite number. A
// problem without nodes or without vehicles yields an empty matrix.
absl::StatusOr<QuboMatrix> VrpToQubo(const VrpProblem& problem,
                                     double penalty = kDefaultPenalty);

}  // namespace qvrp

#endif  // QVRP_QUBO_VRP_ENCODER_H_
