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

#ifndef QVRP_ROUTING_PROBLEM_H_
#define QVRP_ROUTING_PROBLEM_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "qvrp/routing/types.h"

namespace qvrp {

// Checks that `problem` is well formed: the distance matrix is square with as
// many rows as there are nodes, every distance is finite and non-negative, and
// node and vehicle ids match their positions. Symmetry is not required.
// Returns an InvalidArgument error describing the first violation found.
absl::Status ValidateProblem(const VrpProblem& problem);

// Sum of distance_matrix[path[i]][path[i + 1]] over the path.
double PathDistance(const DistanceMatrix& distance_matrix,
                    absl::Span<const int> path);

double TotalDistance(absl::Span<const Route> routes);

// A route is trivial when it visits no customer, i.e. its path is [0] or
// [0, 0].
inline bool IsTrivialRoute(const Route& route) {
  return route.path.size() <= 2;
}

void RemoveTrivialRoutes(std::vector<Route>* routes);

// Returns the customers (non-depot nodes) of `problem` which appear in none of
// the routes, in increasing order.
std::vector<int> FindUnassignedNodes(const VrpProblem& problem,
                                     absl::Span<const Route> routes);

}  // namespace qvrp

#endif  // QVRP_ROUTING_PROBLEM_H_
