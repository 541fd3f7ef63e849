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

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "qvrp/base/gmock.h"
#include "qvrp/quantum/parameters.h"
#include "qvrp/quantum/parameters.pb.h"

namespace qvrp {
namespace {

using ::testing::DoubleNear;
using ::testing::Field;
using ::testing::IsSorted;
using ::testing::SizeIs;
using ::testing::status::StatusIs;

TEST(ComputeQaoaMetricsTest, OneEnergyLevelPerLayer) {
  const QaoaMetrics metrics = ComputeQaoaMetrics(3);
  ASSERT_THAT(metrics.energy_levels, SizeIs(3));
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(metrics.energy_levels[i].layer, i + 1);
    EXPECT_THAT(metrics.energy_levels[i].energy,
                DoubleNear(-10 * (1 - std::exp(-0.5 * (i + 1))), 1e-12));
  }
  EXPECT_GT(metrics.energy_levels[0].energy, metrics.energy_levels[2].energy);
}

TEST(ComputeQaoaMetricsTest, ConvergenceCurve) {
  const QaoaMetrics metrics = ComputeQaoaMetrics(1);
  ASSERT_THAT(metrics.convergence, SizeIs(kNumConvergenceIterations));
  EXPECT_EQ(metrics.convergence.front().iteration, 1);
  EXPECT_THAT(metrics.convergence.front().energy,
              DoubleNear(-10 * (1 - std::exp(-0.1)), 1e-12));
  EXPECT_EQ(metrics.convergence.back().iteration, 20);
  EXPECT_THAT(metrics.convergence.back().energy,
              DoubleNear(-10 * (1 - std::exp(-2.0)), 1e-12));
}

TEST(ComputeQaoaMetricsTest, FixedSpectrumAndStates) {
  const QaoaMetrics metrics = ComputeQaoaMetrics(2);
  EXPECT_THAT(metrics.eigenvalues, SizeIs(8));
  EXPECT_THAT(metrics.eigenvalues, IsSorted());
  EXPECT_EQ(metrics.eigenvalues.front(), -9.8);
  ASSERT_THAT(metrics.state_probabilities, SizeIs(8));
  double total = 0.0;
  for (const QaoaMetrics::StateProbability& state :
       metrics.state_probabilities) {
    total += state.probability;
  }
  EXPECT_THAT(total, DoubleNear(1.0, 1e-12));
  EXPECT_THAT(metrics.state_probabilities.back(),
              Field(&QaoaMetrics::StateProbability::state, "111"));
  EXPECT_EQ(metrics.state_probabilities.back().probability, 0.40);
}

TEST(ComputeQaoaMetricsTest, NoLayerNoEnergyLevel) {
  EXPECT_THAT(ComputeQaoaMetrics(0).energy_levels, SizeIs(0));
}

TEST(GetQaoaMetricsTest, UsesNumLayers) {
  QaoaParameters parameters = DefaultQaoaParameters();
  parameters.set_num_layers(5);
  ASSERT_OK_AND_ASSIGN(const QaoaMetrics metrics, GetQaoaMetrics(parameters));
  EXPECT_THAT(metrics.energy_levels, SizeIs(5));
}

TEST(GetQaoaMetricsTest, RejectsInvalidParameters) {
  QaoaParameters parameters = DefaultQaoaParameters();
  parameters.set_num_layers(0);
  EXPECT_THAT(GetQaoaMetrics(parameters),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace qvrp
