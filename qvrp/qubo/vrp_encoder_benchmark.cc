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

#include <random>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "benchmark/benchmark.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/qubo/vrp_encoder.h"
#include "qvrp/quantum/jittered_nearest_neighbor_sampler.h"
#include "qvrp/routing/problem_generator.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {

VrpProblem BenchmarkProblem(int num_nodes, int num_vehicles) {
  std::mt19937 gen(0);
  absl::StatusOr<VrpProblem> problem = GenerateRandomProblem(
      num_nodes, num_vehicles, kDefaultMaxDistance, gen);
  CHECK_OK(problem.status());
  return *std::move(problem);
}

void BM_VrpToQubo(benchmark::State& state) {
  const VrpProblem problem = BenchmarkProblem(
      static_cast<int>(state.range(0)), static_cast<int>(state.range(1)));
  for (auto _ : state) {
    absl::StatusOr<QuboMatrix> qubo = VrpToQubo(problem);
    CHECK_OK(qubo.status());
    benchmark::DoNotOptimize(qubo);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0) *
                          state.range(0) * state.range(1));
}

BENCHMARK(BM_VrpToQubo)->ArgsProduct({{3, 5, 8, 12, 15}, {1, 3, 5}});

void BM_QuboEnergy(benchmark::State& state) {
  const VrpProblem problem = BenchmarkProblem(
      static_cast<int>(state.range(0)), static_cast<int>(state.range(1)));
  absl::StatusOr<QuboMatrix> qubo = VrpToQubo(problem);
  CHECK_OK(qubo.status());
  JitteredNearestNeighborSampler sampler(0.25, /*seed=*/0);
  const BinaryVector assignment = sampler.Sample(*qubo, problem);
  for (auto _ : state) {
    benchmark::DoNotOptimize(qubo->Energy(assignment));
  }
}

BENCHMARK(BM_QuboEnergy)->ArgsProduct({{5, 10, 15}, {1, 5}});

}  // namespace
}  // namespace qvrp

BENCHMARK_MAIN();
