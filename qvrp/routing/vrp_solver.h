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

#ifndef QVRP_ROUTING_VRP_SOLVER_H_
#define QVRP_ROUTING_VRP_SOLVER_H_

#include "absl/status/statusor.h"
#include "qvrp/routing/types.h"

namespace qvrp {

// Common interface of the route construction strategies. A solver may keep
// internal state between calls (e.g. a random generator), so Solve() is not
// const and a solver must not be shared between threads.
class VrpSolver {
 public:
  virtual ~VrpSolver() = default;

  virtual absl::StatusOr<VrpSolution> Solve(const VrpProblem& problem) = 0;

  // Tag stored in the returned solutions.
  virtual SolverKind kind() const = 0;
};

}  // namespace qvrp

#endif  // QVRP_ROUTING_VRP_SOLVER_H_
