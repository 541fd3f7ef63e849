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

#ifndef QVRP_ROUTING_COMPARISON_H_
#define QVRP_ROUTING_COMPARISON_H_

#include "absl/status/statusor.h"
#include "qvrp/quantum/parameters.pb.h"
#include "qvrp/routing/types.h"

namespace qvrp {

struct SolverComparison {
  VrpSolution quantum;
  VrpSolution classical;
};

// Solves `problem` concurrently with the quantum-inspired and the classical
// solver. Returns the first error encountered, the quantum one first.
absl::StatusOr<SolverComparison> SolveWithBothSolvers(
    const VrpProblem& problem, const QaoaParameters& parameters);

struct SolutionComparison {
  // The solver with the smaller total distance. Ties go to kQuantum.
  SolverKind better_solver = SolverKind::kQuantum;
  // Shares of each total distance in their sum, in percent. Both are 50 when
  // the sum is zero.
  double quantum_share_percent = 50.0;
  double classical_share_percent = 50.0;
  // (loser - winner) / loser, in percent; 0 when the loser's total is 0.
  double improvement_percent = 0.0;
};

SolutionComparison CompareSolutions(const VrpSolution& quantum,
                                    const VrpSolution& classical);

}  // namespace qvrp

#endif  // QVRP_ROUTING_COMPARISON_H_
