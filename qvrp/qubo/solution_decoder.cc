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

#include "qvrp/qubo/solution_decoder.h"

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "qvrp/base/logging.h"
#include "qvrp/base/status_macros.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/routing/problem.h"
#include "qvrp/routing/types.h"

namespace qvrp {

absl::StatusOr<std::vector<Route>> DecodeSolution(
    const BinaryVector& assignment, const VrpProblem& problem) {
  RETURN_IF_ERROR(ValidateProblem(problem));
  const QuboVariableIndex index(problem.num_nodes(), problem.num_vehicles());
  if (static_cast<int64_t>(assignment.size()) != index.num_variables()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Inconsistent dimensions: assignment has ", assignment.size(),
        " entries while the problem has ", index.num_variables(),
        " variables"));
  }
  const int num_nodes = problem.num_nodes();
  const DistanceMatrix& distances = problem.distance_matrix;

  std::vector<Route> routes;
  if (num_nodes == 0) return routes;
  std::vector<bool> visited(num_nodes, false);
  visited[kDepot] = true;
  int num_visited = 1;
  for (const Vehicle& vehicle : problem.vehicles) {
    Route route{.vehicle_id = vehicle.id, .path = {kDepot}};
    int current = kDepot;
    while (num_visited < num_nodes) {
      int next = -1;
      for (int j = 0; j < num_nodes; ++j) {
        if (!visited[j] &&
            assignment[index.Index(current, j, vehicle.id)] == 1) {
          next = j;
          break;
        }
      }
      if (next == -1) break;
      route.path.push_back(next);
      route.distance += distances[current][next];
      visited[next] = true;
      ++num_visited;
      current = next;
    }
    if (route.path.size() > 1) {
      route.path.push_back(kDepot);
      route.distance += distances[current][kDepot];
    }
    VLOG(2) << "Decoded " << route;
    routes.push_back(std::move(route));
  }
  RemoveTrivialRoutes(&routes);
  return routes;
}

}  // namespace qvrp
