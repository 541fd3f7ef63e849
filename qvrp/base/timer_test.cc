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

#include "qvrp/base/timer.h"

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "gtest/gtest.h"

namespace qvrp {
namespace {

TEST(WallTimerTest, ZeroUntilStarted) {
  WallTimer timer;
  absl::SleepFor(absl::Milliseconds(2));
  EXPECT_EQ(timer.GetDuration(), absl::ZeroDuration());
}

TEST(WallTimerTest, MeasuresSinceStart) {
  WallTimer timer;
  timer.Start();
  absl::SleepFor(absl::Milliseconds(5));
  const absl::Duration first = timer.GetDuration();
  EXPECT_GE(first, absl::Milliseconds(5));
  absl::SleepFor(absl::Milliseconds(2));
  EXPECT_GE(timer.GetDuration(), first + absl::Milliseconds(2));
}

TEST(WallTimerTest, RestartDiscardsEarlierInterval) {
  WallTimer timer;
  timer.Start();
  absl::SleepFor(absl::Milliseconds(50));
  timer.Start();
  EXPECT_LT(timer.GetDuration(), absl::Milliseconds(50));
}

}  // namespace
}  // namespace qvrp
