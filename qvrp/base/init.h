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

#ifndef QVRP_BASE_INIT_H_
#define QVRP_BASE_INIT_H_

#include <vector>

#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/strings/string_view.h"

namespace qvrp {

// Initializes logging and parses the command line flags of a qvrp binary.
//
// Must be called early on in main(), before other threads start logging.
// 'usage' is passed to absl::SetProgramUsageMessage(). Returns the positional
// arguments left after flag parsing; the first one is the program name.
inline std::vector<char*> InitQvrp(absl::string_view usage, int argc,
                                   char** argv) {
  if (!usage.empty()) {
    absl::SetProgramUsageMessage(usage);
  }
  std::vector<char*> positional_args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  return positional_args;
}

}  // namespace qvrp

#endif  // QVRP_BASE_INIT_H_
