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

#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "qvrp/routing/comparison.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

VrpProblem ThreeVehicleProblem() {
  VrpProblem problem;
  problem.distance_matrix = {{0, 1, 2}, {1, 0, 4}, {2, 4, 0}};
  for (int i = 0; i < 3; ++i) problem.nodes.push_back({.id = i});
  for (int k = 0; k < 3; ++k) problem.vehicles.push_back({.id = k});
  return problem;
}

TEST(FormatSolutionTest, OneLinePerVehicle) {
  VrpSolution solution;
  solution.solver = SolverKind::kClassical;
  solution.routes = {{.vehicle_id = 0, .path = {0, 1, 0}, .distance = 2},
                     {.vehicle_id = 2, .path = {0, 2, 0}, .distance = 4}};
  solution.total_distance = 6;
  solution.execution_time = absl::Milliseconds(3);
  const std::string plan = FormatSolution(ThreeVehicleProblem(), solution);
  EXPECT_THAT(plan, HasSubstr("Solver classical, total distance 6.00\n"));
  EXPECT_THAT(plan, HasSubstr("Route 0: 0 -> 1 -> 0 (distance 2.00)\n"));
  EXPECT_THAT(plan, HasSubstr("Route 1: Empty\n"));
  EXPECT_THAT(plan, HasSubstr("Route 2: 0 -> 2 -> 0 (distance 4.00)\n"));
  EXPECT_THAT(plan, HasSubstr("Execution time 3ms"));
  EXPECT_THAT(plan, Not(HasSubstr("Unassigned")));
  EXPECT_THAT(plan, Not(HasSubstr("QUBO")));
}

TEST(FormatSolutionTest, ShowsUnassignedNodesAndEnergy) {
  VrpSolution solution;
  solution.solver = SolverKind::kQuantum;
  solution.unassigned_nodes = {1, 2};
  solution.qubo_energy = -12.5;
  const std::string plan = FormatSolution(ThreeVehicleProblem(), solution);
  EXPECT_THAT(plan, HasSubstr("Solver quantum"));
  EXPECT_THAT(plan, HasSubstr("Unassigned nodes: 1, 2\n"));
  EXPECT_THAT(plan, HasSubstr("QUBO energy -12.50\n"));
}

TEST(FormatComparisonTest, NamesTheBetterSolver) {
  SolutionComparison comparison;
  comparison.better_solver = SolverKind::kClassical;
  comparison.quantum_share_percent = 60;
  comparison.classical_share_percent = 40;
  comparison.improvement_percent = 33.333;
  EXPECT_EQ(FormatComparison(comparison),
            "Better solver: classical (33.33% improvement)\n"
            "Share of total distance: quantum 60.00%, classical 40.00%\n");
}

}  // namespace
}  // namespace qvrp
