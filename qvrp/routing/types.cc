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

#include "qvrp/routing/types.h"

#include <ostream>
#include <string>

#include "absl/strings/str_join.h"
#include "qvrp/base/logging.h"

namespace qvrp {

std::ostream& operator<<(std::ostream& out, const Route& route) {
  return out << "{vehicle " << route.vehicle_id << ": "
             << absl::StrJoin(route.path, " -> ") << " (" << route.distance
             << ")}";
}

std::string SolverKindName(SolverKind kind) {
  switch (kind) {
    case SolverKind::kQuantum:
      return "quantum";
    case SolverKind::kClassical:
      return "classical";
  }
  LOG(FATAL) << "Unknown solver kind " << static_cast<int>(kind);
  return "";
}

}  // namespace qvrp
