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

#ifndef QVRP_QUANTUM_BINARY_SAMPLER_H_
#define QVRP_QUANTUM_BINARY_SAMPLER_H_

#include <string>

#include "qvrp/qubo/qubo_matrix.h"
#include "qvrp/routing/types.h"

namespace qvrp {

// Produces an assignment of the QUBO variables x[i,j,k] of a routing problem,
// in the QuboVariableIndex layout. This is where a quantum backend (or an
// annealer minimizing x^T Q x) plugs into the QAOA solver.
class BinarySampler {
 public:
  virtual ~BinarySampler() = default;

  // `qubo` is the encoding of `problem` returned by VrpToQubo(). The returned
  // vector has qubo.num_variables() entries.
  virtual BinaryVector Sample(const QuboMatrix& qubo,
                              const VrpProblem& problem) = 0;

  virtual std::string name() const = 0;
};

}  // namespace qvrp

#endif  // QVRP_QUANTUM_BINARY_SAMPLER_H_
