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

#ifndef QVRP_BASE_TIMER_H_
#define QVRP_BASE_TIMER_H_

#include <cstdint>

#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace qvrp {

// Measures the wall time elapsed since the last Start(), zero before the
// first one.
class WallTimer {
 public:
  WallTimer() : running_(false), start_(0) {}

  void Start() {
    running_ = true;
    start_ = absl::GetCurrentTimeNanos();
  }
  absl::Duration GetDuration() const {
    return running_ ? absl::Nanoseconds(absl::GetCurrentTimeNanos() - start_)
                    : absl::ZeroDuration();
  }

 private:
  bool running_;
  int64_t start_;
};

}  // namespace qvrp

#endif  // QVRP_BASE_TIMER_H_
