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

#include "qvrp/quantum/diagnostics.h"

#include <cmath>

#include "absl/status/statusor.h"
#include "qvrp/base/status_macros.h"
#include "qvrp/quantum/parameters.h"
#include "qvrp/quantum/parameters.pb.h"

namespace qvrp {
namespace {
// Energy approached by the synthetic curves.
constexpr double kGroundEnergy = -10.0;
constexpr double kLayerDecayRate = 0.5;
constexpr double kIterationDecayRate = 0.1;

double DecayedEnergy(double rate, int step) {
  return kGroundEnergy * (1 - std::exp(-rate * step));
}
}  // namespace

QaoaMetrics ComputeQaoaMetrics(int num_layers) {
  QaoaMetrics metrics;
  for (int layer = 1; layer <= num_layers; ++layer) {
    metrics.energy_levels.push_back(
        {.layer = layer, .energy = DecayedEnergy(kLayerDecayRate, layer)});
  }
  for (int iteration = 1; iteration <= kNumConvergenceIterations;
       ++iteration) {
    metrics.convergence.push_back(
        {.iteration = iteration,
         .energy = DecayedEnergy(kIterationDecayRate, iteration)});
  }
  metrics.eigenvalues = {-9.8, -7.5, -5.2, -3.1, -1.8, 0.3, 2.5, 4.7};
  metrics.state_probabilities = {
      {"000", 0.02}, {"001", 0.03}, {"010", 0.05}, {"011", 0.05},
      {"100", 0.10}, {"101", 0.15}, {"110", 0.20}, {"111", 0.40}};
  return metrics;
}

absl::StatusOr<QaoaMetrics> GetQaoaMetrics(const QaoaParameters& parameters) {
  RETURN_IF_ERROR(ValidateQaoaParameters(parameters));
  return ComputeQaoaMetrics(parameters.num_layers());
}

}  // namespace qvrp
