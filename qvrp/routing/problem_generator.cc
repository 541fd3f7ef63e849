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

#include "qvrp/routing/problem_generator.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "absl/random/bit_gen_ref.h"
#include "absl/random/distributions.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "qvrp/base/status_macros.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {
constexpr double kPi = 3.14159265358979323846;

constexpr const char* kVehicleColors[] = {"#8B5CF6", "#0EA5E9", "#20E3B2",
                                          "#F59E0B", "#EF4444"};
constexpr int kNumVehicleColors =
    sizeof(kVehicleColors) / sizeof(kVehicleColors[0]);
}  // namespace

int32_t GetSeed(bool deterministic) {
  if (deterministic) return 0;
  absl::BitGen gen;
  return absl::Uniform<int32_t>(gen, 0, std::numeric_limits<int32_t>::max());
}

absl::StatusOr<DistanceMatrix> GenerateRandomDistanceMatrix(
    int num_nodes, int max_distance, absl::BitGenRef gen) {
  if (num_nodes < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("num_nodes must be non-negative, got ", num_nodes));
  }
  if (max_distance < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("max_distance must be at least 1, got ", max_distance));
  }
  DistanceMatrix matrix(num_nodes, std::vector<double>(num_nodes, 0.0));
  for (int i = 0; i < num_nodes; ++i) {
    for (int j = i + 1; j < num_nodes; ++j) {
      const int distance =
          absl::Uniform(absl::IntervalClosed, gen, 1, max_distance);
      matrix[i][j] = distance;
      matrix[j][i] = distance;
    }
  }
  return matrix;
}

absl::StatusOr<DistanceMatrix> GenerateRandomDistanceMatrix(int num_nodes,
                                                            int max_distance) {
  absl::BitGen gen;
  return GenerateRandomDistanceMatrix(num_nodes, max_distance, gen);
}

std::vector<Node> GenerateNodeCoordinates(
    const DistanceMatrix& distance_matrix) {
  const int num_nodes = distance_matrix.size();
  std::vector<Node> nodes;
  nodes.reserve(num_nodes);
  for (int i = 0; i < num_nodes; ++i) {
    const double angle = 2 * kPi * i / num_nodes;
    nodes.push_back({.id = i,
                     .x = kLayoutRadius * std::cos(angle),
                     .y = kLayoutRadius * std::sin(angle),
                     .label = i == kDepot ? std::string("Depot")
                                          : absl::StrCat("Node ", i)});
  }
  return nodes;
}

const char* VehicleColor(int vehicle_id) {
  return kVehicleColors[vehicle_id % kNumVehicleColors];
}

absl::StatusOr<VrpProblem> GenerateRandomProblem(int num_nodes,
                                                 int num_vehicles,
                                                 int max_distance,
                                                 absl::BitGenRef gen) {
  if (num_nodes < kMinGeneratedNodes || num_nodes > kMaxGeneratedNodes) {
    return absl::InvalidArgumentError(
        absl::StrCat("num_nodes must be in [", kMinGeneratedNodes, ", ",
                     kMaxGeneratedNodes, "], got ", num_nodes));
  }
  if (num_vehicles < 1 || num_vehicles > kMaxGeneratedVehicles) {
    return absl::InvalidArgumentError(
        absl::StrCat("num_vehicles must be in [1, ", kMaxGeneratedVehicles,
                     "], got ", num_vehicles));
  }
  VrpProblem problem;
  ASSIGN_OR_RETURN(problem.distance_matrix,
                   GenerateRandomDistanceMatrix(num_nodes, max_distance, gen));
  problem.nodes = GenerateNodeCoordinates(problem.distance_matrix);
  for (int k = 0; k < num_vehicles; ++k) {
    problem.vehicles.push_back({.id = k, .color = VehicleColor(k)});
  }
  return problem;
}

}  // namespace qvrp
