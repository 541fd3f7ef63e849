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

//
// Solves a random vehicle routing instance with the quantum-inspired QAOA
// pipeline, the classical greedy heuristic, or both. Distances are random
// symmetric integers; every route starts and ends at the depot (node 0).
//
// Example:
//   qvrp_solve --num_nodes=8 --num_vehicles=2 --solver=both \
//     --qaoa_parameters="num_layers: 3 backend: AER_SIMULATOR"

#include <cstdint>
#include <random>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "google/protobuf/text_format.h"
#include "qvrp/base/init.h"
#include "qvrp/base/logging.h"
#include "qvrp/base/status_macros.h"
#include "qvrp/quantum/diagnostics.h"
#include "qvrp/quantum/parameters.h"
#include "qvrp/quantum/parameters.pb.h"
#include "qvrp/quantum/qaoa_solver.h"
#include "qvrp/routing/classical_solver.h"
#include "qvrp/routing/comparison.h"
#include "qvrp/routing/problem_generator.h"
#include "qvrp/routing/solution_display.h"
#include "qvrp/routing/types.h"
#include "qvrp/routing/viewport.h"

ABSL_FLAG(int, num_nodes, 5, "Nodes in the problem, depot included.");
ABSL_FLAG(int, num_vehicles, 2, "Size of the vehicle fleet.");
ABSL_FLAG(int, max_distance, qvrp::kDefaultMaxDistance,
          "Largest random distance between two nodes.");
ABSL_FLAG(std::string, solver, "both",
          "Solver to run: quantum, classical or both.");
ABSL_FLAG(int64_t, seed, -1,
          "Seed of the instance generator and of the sampler. A negative "
          "value picks a random seed.");
ABSL_FLAG(std::string, qaoa_parameters, "",
          "Text proto QaoaParameters (possibly partial) that will override "
          "the DefaultQaoaParameters()");
ABSL_FLAG(int, layout_size, 0,
          "If positive, prints the node coordinates mapped onto a square "
          "canvas of this many pixels.");

namespace qvrp {
namespace {

void DisplayQaoaMetrics(const QaoaMetrics& metrics) {
  std::string output = "QAOA energy per layer:";
  for (const QaoaMetrics::LayerEnergy& level : metrics.energy_levels) {
    absl::StrAppendFormat(&output, " p%d=%.3f", level.layer, level.energy);
  }
  absl::StrAppendFormat(&output,
                        "\nConverged energy after %d iterations: %.3f\n",
                        metrics.convergence.back().iteration,
                        metrics.convergence.back().energy);
  absl::StrAppendFormat(&output, "Ground state eigenvalue: %.1f\n",
                        metrics.eigenvalues.front());
  const QaoaMetrics::StateProbability* most_likely =
      &metrics.state_probabilities.front();
  for (const QaoaMetrics::StateProbability& state :
       metrics.state_probabilities) {
    if (state.probability > most_likely->probability) most_likely = &state;
  }
  absl::StrAppendFormat(&output, "Most likely state: |%s> (%.2f)\n",
                        most_likely->state, most_likely->probability);
  absl::PrintF("%s", output);
}

void DisplayNodeLayout(const VrpProblem& problem, int size) {
  const ViewportTransform viewport(problem.nodes, size, size);
  std::string output =
      absl::StrFormat("Node layout on a %dx%d canvas (scale %.3f):\n", size,
                      size, viewport.scale());
  for (const Node& node : problem.nodes) {
    const ViewportTransform::Point point = viewport.Apply(node);
    absl::StrAppendFormat(&output, "  %s (%.1f, %.1f)\n", node.label,
                          point.x, point.y);
  }
  absl::PrintF("%s", output);
}

absl::Status Run() {
  const std::string solver = absl::GetFlag(FLAGS_solver);
  if (solver != "quantum" && solver != "classical" && solver != "both") {
    return absl::InvalidArgumentError(
        absl::StrFormat("Unknown --solver '%s'", solver));
  }
  QaoaParameters parameters = DefaultQaoaParameters();
  if (!google::protobuf::TextFormat::MergeFromString(
          absl::GetFlag(FLAGS_qaoa_parameters), &parameters)) {
    return absl::InvalidArgumentError(
        "Could not parse --qaoa_parameters as a QaoaParameters text proto");
  }
  const int64_t seed = absl::GetFlag(FLAGS_seed) >= 0
                           ? absl::GetFlag(FLAGS_seed)
                           : GetSeed(/*deterministic=*/false);
  if (!parameters.has_random_seed()) parameters.set_random_seed(seed);
  RETURN_IF_ERROR(ValidateQaoaParameters(parameters));

  std::mt19937_64 generator(seed);
  ASSIGN_OR_RETURN(
      const VrpProblem problem,
      GenerateRandomProblem(absl::GetFlag(FLAGS_num_nodes),
                            absl::GetFlag(FLAGS_num_vehicles),
                            absl::GetFlag(FLAGS_max_distance), generator));
  LOG(INFO) << "Generated a problem with " << problem.num_nodes()
            << " nodes and " << problem.num_vehicles()
            << " vehicles (seed " << seed << ")";
  if (absl::GetFlag(FLAGS_layout_size) > 0) {
    DisplayNodeLayout(problem, absl::GetFlag(FLAGS_layout_size));
  }

  if (solver == "both") {
    ASSIGN_OR_RETURN(const SolverComparison solutions,
                     SolveWithBothSolvers(problem, parameters));
    absl::PrintF("%s\n%s\n%s", FormatSolution(problem, solutions.quantum),
                 FormatSolution(problem, solutions.classical),
                 FormatComparison(CompareSolutions(solutions.quantum,
                                                   solutions.classical)));
  } else if (solver == "quantum") {
    ASSIGN_OR_RETURN(const VrpSolution solution,
                     SolveVrpWithQaoa(problem, parameters));
    absl::PrintF("%s", FormatSolution(problem, solution));
  } else {
    ASSIGN_OR_RETURN(const VrpSolution solution, SolveVrpClassical(problem));
    absl::PrintF("%s", FormatSolution(problem, solution));
  }
  if (solver != "classical") {
    ASSIGN_OR_RETURN(const QaoaMetrics metrics, GetQaoaMetrics(parameters));
    DisplayQaoaMetrics(metrics);
  }
  return absl::OkStatus();
}

}  // namespace
}  // namespace qvrp

int main(int argc, char** argv) {
  qvrp::InitQvrp(
      "Solves a random vehicle routing problem. Sample usage:\n"
      "  qvrp_solve --num_nodes=8 --num_vehicles=2 --solver=both",
      argc, argv);
  const absl::Status status = qvrp::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
