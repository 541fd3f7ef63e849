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

// Synthetic QAOA telemetry for display. Nothing here depends on a solved
// instance: the curves are closed-form functions of the layer count and the
// spectrum and state distribution are fixed.
#ifndef QVRP_QUANTUM_DIAGNOSTICS_H_
#define QVRP_QUANTUM_DIAGNOSTICS_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "qvrp/quantum/parameters.pb.h"

namespace qvrp {

inline constexpr int kNumConvergenceIterations = 20;

struct QaoaMetrics {
  struct LayerEnergy {
    int layer;
    double energy;
  };
  struct ConvergencePoint {
    int iteration;
    double energy;
  };
  struct StateProbability {
    std::string state;
    double probability;
  };

  // energy = -10 * (1 - exp(-0.5 * layer)) for layer = 1..num_layers.
  std::vector<LayerEnergy> energy_levels;
  // energy = -10 * (1 - exp(-0.1 * iteration)) for
  // iteration = 1..kNumConvergenceIterations.
  std::vector<ConvergencePoint> convergence;
  // 8 eigenvalues, in increasing order.
  std::vector<double> eigenvalues;
  // The 8 basis states of 3 qubits; probabilities sum to 1.
  std::vector<StateProbability> state_probabilities;
};

QaoaMetrics ComputeQaoaMetrics(int num_layers);

// Validates `parameters` and returns ComputeQaoaMetrics(num_layers).
absl::StatusOr<QaoaMetrics> GetQaoaMetrics(const QaoaParameters& parameters);

}  // namespace qvrp

#endif  // QVRP_QUANTUM_DIAGNOSTICS_H_
