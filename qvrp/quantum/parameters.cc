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

#include "qvrp/quantum/parameters.h"

#include <cmath>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "qvrp/qubo/vrp_encoder.h"
#include "qvrp/quantum/parameters.pb.h"

namespace qvrp {

QaoaParameters DefaultQaoaParameters() {
  QaoaParameters parameters;
  parameters.set_num_layers(1);
  parameters.set_backend(QaoaParameters::QASM_SIMULATOR);
  parameters.set_shots(1000);
  parameters.set_penalty(kDefaultPenalty);
  parameters.set_jitter_amplitude(0.25);
  return parameters;
}

absl::Status ValidateQaoaParameters(const QaoaParameters& parameters) {
  if (parameters.num_layers() < 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        "num_layers must be at least 1, got ", parameters.num_layers()));
  }
  if (parameters.backend() == QaoaParameters::BACKEND_UNSPECIFIED) {
    return absl::InvalidArgumentError("backend must be specified");
  }
  if (parameters.shots() < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("shots must be at least 1, got ", parameters.shots()));
  }
  if (!std::isfinite(parameters.penalty()) || parameters.penalty() <= 0.0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "penalty must be positive and finite, got ", parameters.penalty()));
  }
  if (!(parameters.jitter_amplitude() >= 0.0 &&
        parameters.jitter_amplitude() < 1.0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("jitter_amplitude must be in [0, 1), got ",
                     parameters.jitter_amplitude()));
  }
  return absl::OkStatus();
}

std::string BackendName(QaoaParameters::Backend backend) {
  return absl::AsciiStrToLower(QaoaParameters::Backend_Name(backend));
}

}  // namespace qvrp
