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

#ifndef QVRP_ROUTING_CLASSICAL_SOLVER_H_
#define QVRP_ROUTING_CLASSICAL_SOLVER_H_

#include "absl/status/statusor.h"
#include "qvrp/routing/types.h"
#include "qvrp/routing/vrp_solver.h"

namespace qvrp {

// Round-robin nearest neighbor construction.
//
// Vehicles take turns, starting with vehicle 0: the vehicle whose turn it is
// appends the unassigned customer closest to the end of its path (lowest id on
// ties). Once every customer is assigned, each vehicle that received one
// returns to the depot. Runs in O(n^2) and does not use the QUBO encoding.
class ClassicalGreedySolver : public VrpSolver {
 public:
  // Returns an InvalidArgument error if the problem is malformed or has no
  // vehicle.
  absl::StatusOr<VrpSolution> Solve(const VrpProblem& problem) override;

  SolverKind kind() const override { return SolverKind::kClassical; }
};

// Convenience wrapper around ClassicalGreedySolver.
absl::StatusOr<VrpSolution> SolveVrpClassical(const VrpProblem& problem);

}  // namespace qvrp

#endif  // QVRP_ROUTING_CLASSICAL_SOLVER_H_
