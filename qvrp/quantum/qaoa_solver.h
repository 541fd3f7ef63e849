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

#ifndef QVRP_QUANTUM_QAOA_SOLVER_H_
#define QVRP_QUANTUM_QAOA_SOLVER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "qvrp/quantum/binary_sampler.h"
#include "qvrp/quantum/parameters.pb.h"
#include "qvrp/routing/types.h"
#include "qvrp/routing/vrp_solver.h"

namespace qvrp {

// Quantum-inspired pipeline: the problem is encoded as a QUBO (VrpToQubo), a
// BinarySampler draws an assignment of its variables, and the assignment is
// decoded into routes (DecodeSolution). The returned solution also carries the
// QUBO energy of the sampled assignment.
//
// Customers the decoded routes miss are reported in
// VrpSolution::unassigned_nodes, with a warning; they are not an error.
class QaoaSolver : public VrpSolver {
 public:
  // Uses a JitteredNearestNeighborSampler configured from `parameters`.
  explicit QaoaSolver(const QaoaParameters& parameters);
  QaoaSolver(const QaoaParameters& parameters,
             std::unique_ptr<BinarySampler> sampler);

  // Returns an InvalidArgument error if the parameters or the problem are
  // invalid, and ResourceExhausted if the QUBO would be too large.
  absl::StatusOr<VrpSolution> Solve(const VrpProblem& problem) override;

  SolverKind kind() const override { return SolverKind::kQuantum; }

  const BinarySampler& sampler() const { return *sampler_; }

 private:
  const QaoaParameters parameters_;
  std::unique_ptr<BinarySampler> sampler_;
};

// Solves `problem` with a fresh QaoaSolver.
absl::StatusOr<VrpSolution> SolveVrpWithQaoa(const VrpProblem& problem,
                                             const QaoaParameters& parameters);

}  // namespace qvrp

#endif  // QVRP_QUANTUM_QAOA_SOLVER_H_
