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

#ifndef QVRP_QUANTUM_PARAMETERS_H_
#define QVRP_QUANTUM_PARAMETERS_H_

#include <string>

#include "absl/status/status.h"
#include "qvrp/quantum/parameters.pb.h"

namespace qvrp {

// Returns p=1 on the QASM simulator with 1000 shots, the default QUBO penalty
// and a +/-25% sampling jitter. The random seed is left unset.
QaoaParameters DefaultQaoaParameters();

// Returns an InvalidArgument error if any field of `parameters` is out of
// range. The error message names the offending field.
absl::Status ValidateQaoaParameters(const QaoaParameters& parameters);

// Returns the lower-case backend name, e.g. "qasm_simulator".
std::string BackendName(QaoaParameters::Backend backend);

}  // namespace qvrp

#endif  // QVRP_QUANTUM_PARAMETERS_H_
