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

#ifndef QVRP_ROUTING_TYPES_H_
#define QVRP_ROUTING_TYPES_H_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/time/time.h"

namespace qvrp {

/// Value types shared by the classical solver, the QUBO encoder/decoder and
/// the quantum-inspired solver. Everything here is a plain value: solvers take
/// a VrpProblem by const reference and return freshly built results.

/// Node 0 is the depot; every route starts and ends there.
inline constexpr int kDepot = 0;

/// Row-major n x n matrix of non-negative travel distances.
typedef std::vector<std::vector<double>> DistanceMatrix;

struct Node {
  int id = 0;
  double x = 0.0;
  double y = 0.0;
  std::string label;
};

struct Vehicle {
  int id = 0;
  /// Not used by the current heuristics.
  std::optional<int64_t> capacity;
  /// Display colour, e.g. "#8B5CF6".
  std::string color;
};

struct VrpProblem {
  int num_nodes() const { return static_cast<int>(nodes.size()); }
  int num_vehicles() const { return static_cast<int>(vehicles.size()); }

  std::vector<Node> nodes;
  std::vector<Vehicle> vehicles;
  DistanceMatrix distance_matrix;
};

struct Route {
  int vehicle_id = 0;
  /// Node ids in visiting order, starting at the depot and, for non-trivial
  /// routes, ending there.
  std::vector<int> path;
  /// Sum of the distances of consecutive path edges.
  double distance = 0.0;

  bool operator==(const Route& other) const {
    return vehicle_id == other.vehicle_id && path == other.path &&
           distance == other.distance;
  }
  bool operator!=(const Route& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& out, const Route& route);

enum class SolverKind { kQuantum, kClassical };

/// Returns "quantum" or "classical".
std::string SolverKindName(SolverKind kind);

struct VrpSolution {
  /// Only routes that visit at least one customer.
  std::vector<Route> routes;
  double total_distance = 0.0;
  absl::Duration execution_time = absl::ZeroDuration();
  SolverKind solver = SolverKind::kClassical;
  /// Customers that no route visits. Always empty for the classical solver;
  /// the quantum-inspired path leaves nodes here when it runs out of vehicles.
  std::vector<int> unassigned_nodes;
  /// x^T Q x of the sampled binary vector (quantum-inspired path only).
  std::optional<double> qubo_energy;
};

}  // namespace qvrp

#endif  // QVRP_ROUTING_TYPES_H_
