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

#include "qvrp/qubo/qubo_matrix.h"

#include <cstdint>

#include "Eigen/Core"
#include "absl/log/check.h"

namespace qvrp {

double QuboMatrix::Energy(const BinaryVector& assignment) const {
  CHECK_EQ(static_cast<int64_t>(assignment.size()), num_variables());
  const Eigen::VectorXd x =
      Eigen::Map<const Eigen::Matrix<int8_t, Eigen::Dynamic, 1>>(
          assignment.data(), assignment.size())
          .cast<double>();
  return x.dot(matrix_ * x);
}

}  // namespace qvrp
