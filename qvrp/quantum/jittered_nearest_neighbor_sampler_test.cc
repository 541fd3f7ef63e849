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

#include "qvrp/quantum/jittered_nearest_neighbor_sampler.h"

#include <cstdint>
#include <random>
#include <vector>

#include "absl/random/random.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "qvrp/base/gmock.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/qubo/vrp_encoder.h"
#include "qvrp/routing/problem_generator.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {

VrpProblem MakeProblem(const DistanceMatrix& distances, int num_vehicles) {
  VrpProblem problem;
  problem.distance_matrix = distances;
  for (int i = 0; i < static_cast<int>(distances.size()); ++i) {
    problem.nodes.push_back({.id = i});
  }
  for (int k = 0; k < num_vehicles; ++k) {
    problem.vehicles.push_back({.id = k});
  }
  return problem;
}

struct Arc {
  int from;
  int to;
  int vehicle;
};

std::vector<Arc> SelectedArcs(const BinaryVector& assignment,
                              const QuboVariableIndex& index) {
  std::vector<Arc> arcs;
  for (int from = 0; from < index.num_nodes(); ++from) {
    for (int to = 0; to < index.num_nodes(); ++to) {
      for (int k = 0; k < index.num_vehicles(); ++k) {
        if (assignment[index.Index(from, to, k)] == 1) {
          arcs.push_back({.from = from, .to = to, .vehicle = k});
        }
      }
    }
  }
  return arcs;
}

TEST(JitteredNearestNeighborSamplerTest, NoJitterIsPlainNearestNeighbor) {
  const VrpProblem problem = MakeProblem(
      {{0, 1, 2, 3}, {1, 0, 4, 5}, {2, 4, 0, 6}, {3, 5, 6, 0}}, 2);
  ASSERT_OK_AND_ASSIGN(const QuboMatrix qubo, VrpToQubo(problem));
  JitteredNearestNeighborSampler sampler(/*jitter_amplitude=*/0.0, /*seed=*/1);
  const BinaryVector assignment = sampler.Sample(qubo, problem);
  const QuboVariableIndex index(4, 2);
  ASSERT_EQ(static_cast<int64_t>(assignment.size()), index.num_variables());
  BinaryVector expected(index.num_variables(), 0);
  expected[index.Index(0, 1, 0)] = 1;
  expected[index.Index(1, 2, 0)] = 1;
  expected[index.Index(2, 3, 0)] = 1;
  expected[index.Index(3, 0, 0)] = 1;
  EXPECT_EQ(assignment, expected);
}

TEST(JitteredNearestNeighborSamplerTest, FirstVehicleServesEveryCustomer) {
  std::mt19937 gen(7);
  for (int trial = 0; trial < 30; ++trial) {
    ASSERT_OK_AND_ASSIGN(
        const VrpProblem problem,
        GenerateRandomProblem(3 + trial % 8, 1 + trial % 3,
                              kDefaultMaxDistance, gen));
    ASSERT_OK_AND_ASSIGN(const QuboMatrix qubo, VrpToQubo(problem));
    JitteredNearestNeighborSampler sampler(0.25, /*seed=*/trial);
    const BinaryVector assignment = sampler.Sample(qubo, problem);
    const QuboVariableIndex index(problem.num_nodes(), problem.num_vehicles());
    const std::vector<Arc> arcs = SelectedArcs(assignment, index);
    ASSERT_EQ(static_cast<int>(arcs.size()), problem.num_nodes());
    std::vector<int> in_degree(problem.num_nodes(), 0);
    std::vector<int> out_degree(problem.num_nodes(), 0);
    for (const Arc& arc : arcs) {
      EXPECT_EQ(arc.vehicle, 0);
      EXPECT_NE(arc.from, arc.to);
      ++out_degree[arc.from];
      ++in_degree[arc.to];
    }
    for (int node = 0; node < problem.num_nodes(); ++node) {
      EXPECT_EQ(in_degree[node], 1) << "node " << node;
      EXPECT_EQ(out_degree[node], 1) << "node " << node;
    }
  }
}

TEST(JitteredNearestNeighborSamplerTest, SameSeedSameSample) {
  absl::BitGen gen;
  ASSERT_OK_AND_ASSIGN(const VrpProblem problem,
                       GenerateRandomProblem(10, 2, kDefaultMaxDistance, gen));
  ASSERT_OK_AND_ASSIGN(const QuboMatrix qubo, VrpToQubo(problem));
  JitteredNearestNeighborSampler first(0.5, 1234);
  JitteredNearestNeighborSampler second(0.5, 1234);
  EXPECT_EQ(first.Sample(qubo, problem), second.Sample(qubo, problem));
}

TEST(JitteredNearestNeighborSamplerTest, DepotOnlyAndNoVehicle) {
  JitteredNearestNeighborSampler sampler(0.25, 3);
  const VrpProblem depot_only = MakeProblem({{0}}, 2);
  ASSERT_OK_AND_ASSIGN(const QuboMatrix depot_qubo, VrpToQubo(depot_only));
  EXPECT_EQ(sampler.Sample(depot_qubo, depot_only), BinaryVector(2, 0));

  const VrpProblem no_vehicle = MakeProblem({{0, 1}, {1, 0}}, 0);
  ASSERT_OK_AND_ASSIGN(const QuboMatrix empty_qubo, VrpToQubo(no_vehicle));
  EXPECT_TRUE(sampler.Sample(empty_qubo, no_vehicle).empty());
}

}  // namespace
}  // namespace qvrp
