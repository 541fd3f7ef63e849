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

#include "qvrp/routing/types.h"

#include <sstream>

#include "gtest/gtest.h"

namespace qvrp {
namespace {

TEST(SolverKindNameTest, Names) {
  EXPECT_EQ(SolverKindName(SolverKind::kQuantum), "quantum");
  EXPECT_EQ(SolverKindName(SolverKind::kClassical), "classical");
}

TEST(RouteTest, Equality) {
  const Route route = {.vehicle_id = 1, .path = {0, 2, 0}, .distance = 4};
  Route other = route;
  EXPECT_EQ(route, other);
  other.path = {0, 3, 0};
  EXPECT_NE(route, other);
}

TEST(RouteTest, Printing) {
  const Route route = {.vehicle_id = 2, .path = {0, 1, 0}, .distance = 2.5};
  std::ostringstream out;
  out << route;
  EXPECT_EQ(out.str(), "{vehicle 2: 0 -> 1 -> 0 (2.5)}");
}

TEST(VrpSolutionTest, DefaultsToEmptyClassicalSolution) {
  const VrpSolution solution;
  EXPECT_TRUE(solution.routes.empty());
  EXPECT_EQ(solution.total_distance, 0.0);
  EXPECT_EQ(solution.solver, SolverKind::kClassical);
  EXPECT_FALSE(solution.qubo_energy.has_value());
}

}  // namespace
}  // namespace qvrp
