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

#include "qvrp/routing/comparison.h"

#include <algorithm>
#include <thread>  // NOLINT
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "qvrp/base/logging.h"
#include "qvrp/quantum/parameters.pb.h"
#include "qvrp/quantum/qaoa_solver.h"
#include "qvrp/routing/classical_solver.h"
#include "qvrp/routing/types.h"

namespace qvrp {

absl::StatusOr<SolverComparison> SolveWithBothSolvers(
    const VrpProblem& problem, const QaoaParameters& parameters) {
  // The classical solver runs on the calling thread while the quantum one
  // runs on its own.
  absl::StatusOr<VrpSolution> quantum;
  std::thread quantum_thread([&problem, &parameters, &quantum] {
    quantum = SolveVrpWithQaoa(problem, parameters);
  });
  absl::StatusOr<VrpSolution> classical = SolveVrpClassical(problem);
  quantum_thread.join();
  if (!quantum.ok()) return quantum.status();
  if (!classical.ok()) return classical.status();
  VLOG(1) << "Quantum total: " << quantum->total_distance
          << ", classical total: " << classical->total_distance;
  return SolverComparison{.quantum = *std::move(quantum),
                          .classical = *std::move(classical)};
}

SolutionComparison CompareSolutions(const VrpSolution& quantum,
                                    const VrpSolution& classical) {
  SolutionComparison comparison;
  const double q = quantum.total_distance;
  const double c = classical.total_distance;
  comparison.better_solver =
      q <= c ? SolverKind::kQuantum : SolverKind::kClassical;
  const double sum = q + c;
  if (sum > 0) {
    comparison.quantum_share_percent = 100.0 * q / sum;
    comparison.classical_share_percent = 100.0 * c / sum;
  }
  const double winner = std::min(q, c);
  const double loser = std::max(q, c);
  if (loser > 0) {
    comparison.improvement_percent = 100.0 * (loser - winner) / loser;
  }
  return comparison;
}

}  // namespace qvrp
