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

#ifndef QVRP_QUBO_QUBO_MATRIX_H_
#define QVRP_QUBO_QUBO_MATRIX_H_

#include <cstdint>
#include <vector>

#include "Eigen/Core"
#include "absl/log/check.h"

namespace qvrp {

// Assignment of the binary variables of a QUBO, one entry (0 or 1) per
// variable.
typedef std::vector<int8_t> BinaryVector;

// Maps the routing decision variable x[i,j,k] ("vehicle k travels directly
// from node i to node j") to its position in the QUBO variable vector:
//   index(i, j, k) = i * n * v + j * v + k
// with n nodes and v vehicles. The encoder, the samplers and the decoder all
// go through this class so that they agree on the layout.
class QuboVariableIndex {
 public:
  QuboVariableIndex(int num_nodes, int num_vehicles)
      : num_nodes_(num_nodes), num_vehicles_(num_vehicles) {
    DCHECK_GE(num_nodes, 0);
    DCHECK_GE(num_vehicles, 0);
  }

  int num_nodes() const { return num_nodes_; }
  int num_vehicles() const { return num_vehicles_; }
  int64_t num_variables() const {
    return static_cast<int64_t>(num_nodes_) * num_nodes_ * num_vehicles_;
  }

  int64_t Index(int from, int to, int vehicle) const {
    DCHECK_GE(from, 0);
    DCHECK_LT(from, num_nodes_);
    DCHECK_GE(to, 0);
    DCHECK_LT(to, num_nodes_);
    DCHECK_GE(vehicle, 0);
    DCHECK_LT(vehicle, num_vehicles_);
    return (static_cast<int64_t>(from) * num_nodes_ + to) * num_vehicles_ +
           vehicle;
  }

 private:
  int num_nodes_;
  int num_vehicles_;
};

// Dense QUBO coefficient matrix Q; the objective of an assignment x is
// x^T Q x. Diagonal entries hold the linear coefficients, off-diagonal entries
// the quadratic ones. Coefficients are accumulated, never overwritten, and the
// matrix is not symmetrized: a quadratic term added at (a, b) stays there.
class QuboMatrix {
 public:
  QuboMatrix() : QuboMatrix(0) {}
  explicit QuboMatrix(int64_t num_variables)
      : matrix_(Eigen::MatrixXd::Zero(num_variables, num_variables)) {}

  int64_t num_variables() const { return matrix_.rows(); }

  double coefficient(int64_t row, int64_t col) const {
    return matrix_(row, col);
  }

  void AddToCoefficient(int64_t row, int64_t col, double value) {
    DCHECK_LT(row, num_variables());
    DCHECK_LT(col, num_variables());
    matrix_(row, col) += value;
  }

  // Returns x^T Q x. `assignment` must have num_variables() entries.
  double Energy(const BinaryVector& assignment) const;

  const Eigen::MatrixXd& matrix() const { return matrix_; }

 private:
  Eigen::MatrixXd matrix_;
};

}  // namespace qvrp

#endif  // QVRP_QUBO_QUBO_MATRIX_H_
