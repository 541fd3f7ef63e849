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

#include "qvrp/quantum/qaoa_solver.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "qvrp/base/logging.h"
#include "qvrp/base/status_macros.h"
#include "qvrp/base/timer.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/qubo/solution_decoder.h"
#include "qvrp/qubo/vrp_encoder.h"
#include "qvrp/quantum/binary_sampler.h"
#include "qvrp/quantum/jittered_nearest_neighbor_sampler.h"
#include "qvrp/quantum/parameters.h"
#include "qvrp/quantum/parameters.pb.h"
#include "qvrp/routing/problem.h"
#include "qvrp/routing/problem_generator.h"
#include "qvrp/routing/types.h"

namespace qvrp {

QaoaSolver::QaoaSolver(const QaoaParameters& parameters)
    : QaoaSolver(parameters,
                 std::make_unique<JitteredNearestNeighborSampler>(
                     parameters.jitter_amplitude(),
                     parameters.has_random_seed()
                         ? parameters.random_seed()
                         : GetSeed(/*deterministic=*/false))) {}

QaoaSolver::QaoaSolver(const QaoaParameters& parameters,
                       std::unique_ptr<BinarySampler> sampler)
    : parameters_(parameters), sampler_(std::move(sampler)) {
  CHECK(sampler_ != nullptr);
}

absl::StatusOr<VrpSolution> QaoaSolver::Solve(const VrpProblem& problem) {
  RETURN_IF_ERROR(ValidateQaoaParameters(parameters_));
  LOG(INFO) << absl::StrFormat(
      "Solving VRP with QAOA (p=%d, backend=%s, shots=%d)",
      parameters_.num_layers(), BackendName(parameters_.backend()),
      parameters_.shots());
  WallTimer timer;
  timer.Start();

  ASSIGN_OR_RETURN(const QuboMatrix qubo,
                   VrpToQubo(problem, parameters_.penalty()));
  const BinaryVector assignment = sampler_->Sample(qubo, problem);
  ASSIGN_OR_RETURN(std::vector<Route> routes,
                   DecodeSolution(assignment, problem));

  VrpSolution solution;
  solution.total_distance = TotalDistance(routes);
  solution.unassigned_nodes = FindUnassignedNodes(problem, routes);
  solution.routes = std::move(routes);
  solution.solver = kind();
  solution.qubo_energy = qubo.Energy(assignment);
  solution.execution_time = timer.GetDuration();
  if (!solution.unassigned_nodes.empty()) {
    LOG(WARNING) << "Sampler " << sampler_->name() << " left "
                 << solution.unassigned_nodes.size()
                 << " node(s) unassigned: "
                 << absl::StrJoin(solution.unassigned_nodes, ", ");
  }
  VLOG(1) << "QUBO energy of the sampled assignment: "
          << *solution.qubo_energy;
  return solution;
}

absl::StatusOr<VrpSolution> SolveVrpWithQaoa(const VrpProblem& problem,
                                             const QaoaParameters& parameters) {
  QaoaSolver solver(parameters);
  return solver.Solve(problem);
}

}  // namespace qvrp
