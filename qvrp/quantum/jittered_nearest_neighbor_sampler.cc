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
#include <limits>
#include <set>

#include "absl/random/distributions.h"
#include "absl/random/random.h"
#include "absl/random/seed_sequences.h"
#include "qvrp/base/logging.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {
absl::SeedSeq MakeSeedSeq(int64_t seed) {
  const uint64_t bits = static_cast<uint64_t>(seed);
  return absl::SeedSeq({static_cast<uint32_t>(bits),
                        static_cast<uint32_t>(bits >> 32)});
}
}  // namespace

JitteredNearestNeighborSampler::JitteredNearestNeighborSampler(
    double jitter_amplitude, int64_t seed)
    : jitter_amplitude_(jitter_amplitude), random_(MakeSeedSeq(seed)) {}

BinaryVector JitteredNearestNeighborSampler::Sample(const QuboMatrix& qubo,
                                                    const VrpProblem& problem) {
  const QuboVariableIndex index(problem.num_nodes(), problem.num_vehicles());
  DCHECK_EQ(qubo.num_variables(), index.num_variables());
  BinaryVector assignment(index.num_variables(), 0);
  const DistanceMatrix& distances = problem.distance_matrix;

  std::set<int> remaining;
  for (int node = kDepot + 1; node < problem.num_nodes(); ++node) {
    remaining.insert(node);
  }
  for (int k = 0; k < problem.num_vehicles() && !remaining.empty(); ++k) {
    int current = kDepot;
    while (!remaining.empty()) {
      int best_node = -1;
      double best_distance = std::numeric_limits<double>::infinity();
      for (const int node : remaining) {
        const double jitter =
            jitter_amplitude_ > 0.0
                ? absl::Uniform(random_, -jitter_amplitude_, jitter_amplitude_)
                : 0.0;
        const double distance = distances[current][node] * (1 + jitter);
        if (distance < best_distance) {
          best_distance = distance;
          best_node = node;
        }
      }
      if (best_node == -1) break;
      assignment[index.Index(current, best_node, k)] = 1;
      VLOG(2) << "Vehicle " << k << ": x[" << current << ", " << best_node
              << "] = 1";
      remaining.erase(best_node);
      current = best_node;
    }
    if (current != kDepot) {
      assignment[index.Index(current, kDepot, k)] = 1;
    }
  }
  return assignment;
}

}  // namespace qvrp
