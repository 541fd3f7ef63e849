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

#ifndef QVRP_QUBO_SOLUTION_DECODER_H_
#define QVRP_QUBO_SOLUTION_DECODER_H_

#include <vector>

#include "absl/status/statusor.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/routing/types.h"

namespace qvrp {

// Turns an assignment of the QUBO variables x[i,j,k] back into routes.
//
// Vehicles are decoded in id order. Each one starts at the depot and, from its
// current node, moves to the lowest-id customer j not yet visited by any
// vehicle with x[current, j, k] == 1, accumulating d[current][j]. A vehicle
// that moved at least once returns to the depot. Routes that visit no customer
// are dropped.
//
// The assignment is not checked for feasibility: a customer claimed by several
// variables goes to the first vehicle that reaches it, other claims and
// unreachable bits are ignored. Returns an InvalidArgument error only when the
// problem is malformed or `assignment` does not have n^2 * v entries.
absl::StatusOr<std::vector<Route>> DecodeSolution(
    const BinaryVector& assignment, const VrpProblem& problem);

}  // namespace qvrp

#endif  // QVRP_QUBO_SOLUTION_DECODER_H_
