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

// This header provides functions to help create random instances of the
// vehicle routing problem: random symmetric distance matrices, a circular node
// layout for display and a complete problem with a coloured fleet.
#ifndef QVRP_ROUTING_PROBLEM_GENERATOR_H_
#define QVRP_ROUTING_PROBLEM_GENERATOR_H_

#include <cstdint>
#include <vector>

#include "absl/random/bit_gen_ref.h"
#include "absl/status/statusor.h"
#include "qvrp/routing/types.h"

namespace qvrp {

inline constexpr int kDefaultMaxDistance = 100;
inline constexpr double kLayoutRadius = 100.0;

// Sizes accepted by GenerateRandomProblem().
inline constexpr int kMinGeneratedNodes = 3;
inline constexpr int kMaxGeneratedNodes = 15;
inline constexpr int kMaxGeneratedVehicles = 5;

// Random seed generator.
int32_t GetSeed(bool deterministic);

// Returns a symmetric num_nodes x num_nodes matrix with a zero diagonal and
// integer distances drawn uniformly in [1, max_distance] elsewhere.
absl::StatusOr<DistanceMatrix> GenerateRandomDistanceMatrix(
    int num_nodes, int max_distance, absl::BitGenRef gen);
absl::StatusOr<DistanceMatrix> GenerateRandomDistanceMatrix(
    int num_nodes, int max_distance = kDefaultMaxDistance);

// Places the nodes of `distance_matrix` evenly on a circle of radius
// kLayoutRadius centred on the origin, node i at angle 2*pi*i/n. This is a
// display layout only: it does not embed the distances.
std::vector<Node> GenerateNodeCoordinates(
    const DistanceMatrix& distance_matrix);

// Returns the display colour of the vehicle with the given id; the palette is
// cycled for large fleets.
const char* VehicleColor(int vehicle_id);

// Builds a complete random problem: distance matrix, circular layout and a
// fleet of `num_vehicles` coloured vehicles.
absl::StatusOr<VrpProblem> GenerateRandomProblem(int num_nodes,
                                                 int num_vehicles,
                                                 int max_distance,
                                                 absl::BitGenRef gen);

}  // namespace qvrp

#endif  // QVRP_ROUTING_PROBLEM_GENERATOR_H_
