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

#include "qvrp/routing/problem.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "qvrp/base/logging.h"
#include "qvrp/routing/types.h"

namespace qvrp {

absl::Status ValidateProblem(const VrpProblem& problem) {
  const int num_nodes = problem.num_nodes();
  const DistanceMatrix& matrix = problem.distance_matrix;
  if (static_cast<int>(matrix.size()) != num_nodes) {
    return absl::InvalidArgumentError(
        absl::StrCat("Inconsistent dimensions: problem has ", num_nodes,
                     " nodes while the distance matrix has ", matrix.size(),
                     " rows"));
  }
  for (int i = 0; i < num_nodes; ++i) {
    if (static_cast<int>(matrix[i].size()) != num_nodes) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Inconsistent dimensions: distance matrix row ", i, " has ",
          matrix[i].size(), " columns, expected ", num_nodes));
    }
    for (int j = 0; j < num_nodes; ++j) {
      const double distance = matrix[i][j];
      if (!std::isfinite(distance) || distance < 0.0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Distance from node ", i, " to node ", j,
                         " must be finite and non-negative, got ", distance));
      }
    }
  }
  for (int i = 0; i < num_nodes; ++i) {
    if (problem.nodes[i].id != i) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Node at position ", i, " has id ", problem.nodes[i].id));
    }
  }
  for (int k = 0; k < problem.num_vehicles(); ++k) {
    if (problem.vehicles[k].id != k) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Vehicle at position ", k, " has id ", problem.vehicles[k].id));
    }
  }
  return absl::OkStatus();
}

double PathDistance(const DistanceMatrix& distance_matrix,
                    absl::Span<const int> path) {
  double distance = 0.0;
  for (size_t i = 1; i < path.size(); ++i) {
    distance += distance_matrix[path[i - 1]][path[i]];
  }
  return distance;
}

double TotalDistance(absl::Span<const Route> routes) {
  double total = 0.0;
  for (const Route& route : routes) total += route.distance;
  return total;
}

void RemoveTrivialRoutes(std::vector<Route>* routes) {
  routes->erase(std::remove_if(routes->begin(), routes->end(), IsTrivialRoute),
                routes->end());
}

std::vector<int> FindUnassignedNodes(const VrpProblem& problem,
                                     absl::Span<const Route> routes) {
  std::vector<bool> visited(problem.num_nodes(), false);
  for (const Route& route : routes) {
    for (const int node : route.path) {
      DCHECK_GE(node, 0);
      DCHECK_LT(node, problem.num_nodes());
      visited[node] = true;
    }
  }
  std::vector<int> unassigned;
  for (int node = kDepot + 1; node < problem.num_nodes(); ++node) {
    if (!visited[node]) unassigned.push_back(node);
  }
  return unassigned;
}

}  // namespace qvrp
