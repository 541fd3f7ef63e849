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

#include "qvrp/qubo/vrp_encoder.h"

#include <cmath>
#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "qvrp/base/logging.h"
#include "qvrp/base/status_macros.h"
#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/routing/problem.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {

void AddTravelCost(const DistanceMatrix& distances,
                   const QuboVariableIndex& index, QuboMatrix* qubo) {
  const int n = index.num_nodes();
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      if (i == j) continue;
      for (int k = 0; k < index.num_vehicles(); ++k) {
        const int64_t var = index.Index(i, j, k);
        qubo->AddToCoefficient(var, var, distances[i][j]);
      }
    }
  }
}

void AddEnterOnceConstraints(const QuboVariableIndex& index, double penalty,
                             QuboMatrix* qubo) {
  const int n = index.num_nodes();
  const int v = index.num_vehicles();
  for (int j = kDepot + 1; j < n; ++j) {
    for (int i1 = 0; i1 < n; ++i1) {
      for (int k1 = 0; k1 < v; ++k1) {
        const int64_t var1 = index.Index(i1, j, k1);
        qubo->AddToCoefficient(var1, var1, -penalty);
        for (int i2 = 0; i2 < n; ++i2) {
          for (int k2 = 0; k2 < v; ++k2) {
            if (i1 == i2 && k1 == k2) continue;
            qubo->AddToCoefficient(var1, index.Index(i2, j, k2), 2 * penalty);
          }
        }
      }
    }
  }
}

void AddLeaveOnceConstraints(const QuboVariableIndex& index, double penalty,
                             QuboMatrix* qubo) {
  const int n = index.num_nodes();
  const int v = index.num_vehicles();
  for (int i = kDepot + 1; i < n; ++i) {
    for (int j1 = 0; j1 < n; ++j1) {
      if (j1 == i) continue;
      for (int k1 = 0; k1 < v; ++k1) {
        const int64_t var1 = index.Index(i, j1, k1);
        qubo->AddToCoefficient(var1, var1, -penalty);
        for (int j2 = 0; j2 < n; ++j2) {
          if (j2 == i) continue;
          for (int k2 = 0; k2 < v; ++k2) {
            if (j1 == j2 && k1 == k2) continue;
            qubo->AddToCoefficient(var1, index.Index(i, j2, k2), 2 * penalty);
          }
        }
      }
    }
  }
}

void AddFlowContinuityConstraints(const QuboVariableIndex& index,
                                  double penalty, QuboMatrix* qubo) {
  const int n = index.num_nodes();
  for (int m = kDepot + 1; m < n; ++m) {
    for (int k = 0; k < index.num_vehicles(); ++k) {
      for (int i = 0; i < n; ++i) {
        if (i == m) continue;
        const int64_t incoming = index.Index(i, m, k);
        for (int j = 0; j < n; ++j) {
          if (j == m) continue;
          const int64_t outgoing = index.Index(m, j, k);
          qubo->AddToCoefficient(incoming, incoming, penalty);
          qubo->AddToCoefficient(outgoing, outgoing, penalty);
          qubo->AddToCoefficient(incoming, outgoing, -2 * penalty);
        }
      }
    }
  }
}

}  // namespace

absl::StatusOr<QuboMatrix> VrpToQubo(const VrpProblem& problem,
                                     double penalty) {
  RETURN_IF_ERROR(ValidateProblem(problem));
  if (!std::isfinite(penalty) || penalty <= 0.0) {
    return absl::InvalidArgumentError(
        absl::StrCat("penalty must be positive and finite, got ", penalty));
  }
  const QuboVariableIndex index(problem.num_nodes(), problem.num_vehicles());
  if (index.num_variables() > kMaxQuboVariables) {
    return absl::ResourceExhaustedError(absl::StrCat(
        "QUBO with ", problem.num_nodes(), " nodes and ",
        problem.num_vehicles(), " vehicles has ", index.num_variables(),
        " variables, more than the supported ", kMaxQuboVariables));
  }
  QuboMatrix qubo(index.num_variables());
  if (index.num_variables() == 0) return qubo;

  AddTravelCost(problem.distance_matrix, index, &qubo);
  AddEnterOnceConstraints(index, penalty, &qubo);
  AddLeaveOnceConstraints(index, penalty, &qubo);
  AddFlowContinuityConstraints(index, penalty, &qubo);
  VLOG(1) << "Encoded VRP with " << problem.num_nodes() << " nodes and "
          << problem.num_vehicles() << " vehicles into a QUBO with "
          << qubo.num_variables() << " variables";
  return qubo;
}

}  // namespace qvrp
