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

#include "qvrp/routing/classical_solver.h"

#include <limits>
#include <set>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "qvrp/base/logging.h"
#include "qvrp/base/status_macros.h"
#include "qvrp/base/timer.h"
#include "qvrp/routing/problem.h"
#include "qvrp/routing/types.h"

namespace qvrp {

absl::StatusOr<VrpSolution> ClassicalGreedySolver::Solve(
    const VrpProblem& problem) {
  RETURN_IF_ERROR(ValidateProblem(problem));
  if (problem.vehicles.empty()) {
    return absl::InvalidArgumentError(
        "The classical solver needs at least one vehicle");
  }
  WallTimer timer;
  timer.Start();
  const DistanceMatrix& distances = problem.distance_matrix;
  const int num_vehicles = problem.num_vehicles();

  std::vector<Route> routes;
  routes.reserve(num_vehicles);
  for (const Vehicle& vehicle : problem.vehicles) {
    routes.push_back({.vehicle_id = vehicle.id, .path = {kDepot}});
  }
  std::set<int> unassigned;
  for (int node = kDepot + 1; node < problem.num_nodes(); ++node) {
    unassigned.insert(node);
  }

  int vehicle = 0;
  while (!unassigned.empty()) {
    Route& route = routes[vehicle];
    const int current = route.path.back();
    int best_node = -1;
    double best_distance = std::numeric_limits<double>::infinity();
    for (const int node : unassigned) {
      if (distances[current][node] < best_distance) {
        best_distance = distances[current][node];
        best_node = node;
      }
    }
    DCHECK_NE(best_node, -1);
    route.path.push_back(best_node);
    route.distance += best_distance;
    unassigned.erase(best_node);
    VLOG(2) << "Vehicle " << route.vehicle_id << " goes to node " << best_node;
    vehicle = (vehicle + 1) % num_vehicles;
  }

  for (Route& route : routes) {
    const int last = route.path.back();
    if (last != kDepot) {
      route.path.push_back(kDepot);
      route.distance += distances[last][kDepot];
    }
  }
  RemoveTrivialRoutes(&routes);

  VrpSolution solution;
  solution.total_distance = TotalDistance(routes);
  solution.routes = std::move(routes);
  solution.solver = kind();
  solution.execution_time = timer.GetDuration();
  return solution;
}

absl::StatusOr<VrpSolution> SolveVrpClassical(const VrpProblem& problem) {
  ClassicalGreedySolver solver;
  return solver.Solve(problem);
}

}  // namespace qvrp
