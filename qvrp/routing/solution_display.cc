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

#include "qvrp/routing/solution_display.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"
#include "qvrp/routing/comparison.h"
#include "qvrp/routing/types.h"

namespace qvrp {

std::string FormatSolution(const VrpProblem& problem,
                           const VrpSolution& solution) {
  std::string plan_output =
      absl::StrFormat("Solver %s, total distance %.2f\n",
                      SolverKindName(solution.solver), solution.total_distance);
  if (!solution.unassigned_nodes.empty()) {
    absl::StrAppend(&plan_output, "Unassigned nodes: ",
                    absl::StrJoin(solution.unassigned_nodes, ", "), "\n");
  }
  for (const Vehicle& vehicle : problem.vehicles) {
    absl::StrAppendFormat(&plan_output, "Route %d: ", vehicle.id);
    const Route* route = nullptr;
    for (const Route& candidate : solution.routes) {
      if (candidate.vehicle_id == vehicle.id) {
        route = &candidate;
        break;
      }
    }
    if (route == nullptr) {
      plan_output += "Empty\n";
    } else {
      absl::StrAppendFormat(&plan_output, "%s (distance %.2f)\n",
                            absl::StrJoin(route->path, " -> "),
                            route->distance);
    }
  }
  if (solution.qubo_energy.has_value()) {
    absl::StrAppendFormat(&plan_output, "QUBO energy %.2f\n",
                          *solution.qubo_energy);
  }
  absl::StrAppend(&plan_output, "Execution time ",
                  absl::FormatDuration(solution.execution_time), "\n");
  return plan_output;
}

std::string FormatComparison(const SolutionComparison& comparison) {
  return absl::StrFormat(
      "Better solver: %s (%.2f%% improvement)\n"
      "Share of total distance: quantum %.2f%%, classical %.2f%%\n",
      SolverKindName(comparison.better_solver),
      comparison.improvement_percent, comparison.quantum_share_percent,
      comparison.classical_share_percent);
}

}  // namespace qvrp
