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

#include "qvrp/routing/viewport.h"

#include <cmath>
#include <vector>

#include "gtest/gtest.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {

constexpr double kPi = 3.14159265358979323846;

TEST(ViewportTransformTest, MapsBoundingBoxIntoMargins) {
  const std::vector<Node> nodes = {{.id = 0, .x = -100, .y = -50},
                                   {.id = 1, .x = 100, .y = 50}};
  const ViewportTransform transform(nodes, /*width=*/480, /*height=*/480);
  // The x extent (200) limits the scale: (480 - 80) / 200.
  EXPECT_DOUBLE_EQ(transform.scale(), 2.0);
  const ViewportTransform::Point low = transform.Apply(nodes[0]);
  EXPECT_DOUBLE_EQ(low.x, 40.0);
  EXPECT_DOUBLE_EQ(low.y, 40.0);
  const ViewportTransform::Point high = transform.Apply(nodes[1]);
  EXPECT_DOUBLE_EQ(high.x, 440.0);
  EXPECT_DOUBLE_EQ(high.y, 240.0);
}

TEST(ViewportTransformTest, TallBoxIsLimitedByHeight) {
  const std::vector<Node> nodes = {{.id = 0, .x = 0, .y = 0},
                                   {.id = 1, .x = 10, .y = 100}};
  const ViewportTransform transform(nodes, 800, 220, /*margin=*/10);
  EXPECT_DOUBLE_EQ(transform.scale(), 2.0);
  EXPECT_DOUBLE_EQ(transform.Apply(10, 100).y, 210.0);
}

TEST(ViewportTransformTest, DegenerateExtentStaysFinite) {
  const std::vector<Node> single = {{.id = 0, .x = 3, .y = 4}};
  const ViewportTransform transform(single, 480, 480);
  EXPECT_TRUE(std::isfinite(transform.scale()));
  EXPECT_DOUBLE_EQ(transform.Apply(single[0]).x, kDefaultViewportMargin);

  const std::vector<Node> collinear = {{.id = 0, .x = 0, .y = 5},
                                       {.id = 1, .x = 100, .y = 5}};
  const ViewportTransform flat(collinear, 480, 480);
  EXPECT_DOUBLE_EQ(flat.scale(), 4.0);
  EXPECT_DOUBLE_EQ(flat.Apply(collinear[1]).x, 440.0);
}

TEST(ViewportTransformTest, CircleLayoutFitsTheCanvas) {
  std::vector<Node> nodes;
  for (int i = 0; i < 7; ++i) {
    const double angle = 2 * kPi * i / 7;
    nodes.push_back(
        {.id = i, .x = 100 * std::cos(angle), .y = 100 * std::sin(angle)});
  }
  const ViewportTransform transform(nodes, 600, 400);
  for (const Node& node : nodes) {
    const ViewportTransform::Point point = transform.Apply(node);
    EXPECT_GE(point.x, 40.0 - 1e-9);
    EXPECT_LE(point.x, 560.0 + 1e-9);
    EXPECT_GE(point.y, 40.0 - 1e-9);
    EXPECT_LE(point.y, 360.0 + 1e-9);
  }
}

TEST(ViewportTransformTest, NoNodeOnlyShiftsByMargin) {
  const ViewportTransform transform({}, 480, 480);
  EXPECT_DOUBLE_EQ(transform.Apply(0, 0).x, kDefaultViewportMargin);
  EXPECT_DOUBLE_EQ(transform.Apply(5, 0).x, kDefaultViewportMargin + 5);
}

}  // namespace
}  // namespace qvrp
