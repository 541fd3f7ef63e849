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

#include <algorithm>
#include <limits>

#include "absl/types/span.h"
#include "qvrp/routing/types.h"

namespace qvrp {
namespace {
constexpr double kMinExtent = 1.0;
}  // namespace

ViewportTransform::ViewportTransform(absl::Span<const Node> nodes,
                                     double width, double height,
                                     double margin)
    : margin_(margin) {
  if (nodes.empty()) return;
  double max_x = -std::numeric_limits<double>::infinity();
  double max_y = -std::numeric_limits<double>::infinity();
  min_x_ = std::numeric_limits<double>::infinity();
  min_y_ = std::numeric_limits<double>::infinity();
  for (const Node& node : nodes) {
    min_x_ = std::min(min_x_, node.x);
    min_y_ = std::min(min_y_, node.y);
    max_x = std::max(max_x, node.x);
    max_y = std::max(max_y, node.y);
  }
  const double extent_x = std::max(max_x - min_x_, kMinExtent);
  const double extent_y = std::max(max_y - min_y_, kMinExtent);
  scale_ = std::min((width - 2 * margin_) / extent_x,
                    (height - 2 * margin_) / extent_y);
}

ViewportTransform::Point ViewportTransform::Apply(double x, double y) const {
  return {.x = margin_ + (x - min_x_) * scale_,
          .y = margin_ + (y - min_y_) * scale_};
}

}  // namespace qvrp
