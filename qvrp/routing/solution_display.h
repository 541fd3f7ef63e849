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

#ifndef QVRP_ROUTING_SOLUTION_DISPLAY_H_
#define QVRP_ROUTING_SOLUTION_DISPLAY_H_

#include <string>

#include "qvrp/routing/comparison.h"
#include "qvrp/routing/types.h"

namespace qvrp {

// Returns a human readable plan: the solver and total distance, the
// unassigned customers if any, then one line per vehicle with its path and
// distance ("Empty" for vehicles without a route), and the execution time.
std::string FormatSolution(const VrpProblem& problem,
                           const VrpSolution& solution);

std::string FormatComparison(const SolutionComparison& comparison);

}  // namespace qvrp

#endif  // QVRP_ROUTING_SOLUTION_DISPLAY_H_
