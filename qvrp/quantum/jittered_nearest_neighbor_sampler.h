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

#ifndef QVRP_QUANTUM_JITTERED_NEAREST_NEIGHBOR_SAMPLER_H_
#define QVRP_QUANTUM_JITTERED_NEAREST_NEIGHBOR_SAMPLER_H_

#include <cstdint>
#include <string>

#include "absl/random/random.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/quantum/binary_sampler.h"
#include "qvrp/routing/types.h"

namespace qvrp {

// Stands in for quantum sampling with a randomized nearest neighbor tour.
//
// Vehicles are processed in id order. Starting from the depot, a vehicle
// repeatedly moves to the unvisited customer minimizing
// d[current][j] * (1 + u), u drawn uniformly in [-jitter, jitter) for each
// candidate, and sets x[current, j, k]. When no customer is left, a vehicle
// that moved sets x[current, depot, k] and the next vehicle starts. As
// there is no capacity, the first vehicle ends up serving every customer.
//
// The QUBO matrix is not read: distances come from the problem itself.
class JitteredNearestNeighborSampler : public BinarySampler {
 public:
  // `jitter_amplitude` must be in [0, 1). Samplers built with the same seed
  // draw the same sequence of tours.
  JitteredNearestNeighborSampler(double jitter_amplitude, int64_t seed);

  BinaryVector Sample(const QuboMatrix& qubo,
                      const VrpProblem& problem) override;

  std::string name() const override { return "jittered_nearest_neighbor"; }

 private:
  const double jitter_amplitude_;
  absl::BitGen random_;
};

}  // namespace qvrp

#endif  // QVRP_QUANTUM_JITTERED_NEAREST_NEIGHBOR_SAMPLER_H_
