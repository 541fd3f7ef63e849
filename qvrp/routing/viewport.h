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

#ifndef QVRP_ROUTING_VIEWPORT_H_
#define QVRP_ROUTING_VIEWPORT_H_

#include "absl/types/span.h"
#include "qvrp/routing/types.h"

namespace qvrp {

inline constexpr double kDefaultViewportMargin = 40.0;

// Maps node coordinates into a width x height canvas, keeping a margin on
// every side and preserving the aspect ratio of the nodes' bounding box.
//
// A bounding box extent smaller than 1 (e.g. a single node, or collinear
// nodes) is taken to be 1 so that the scale stays finite.
class ViewportTransform {
 public:
  struct Point {
    double x;
    double y;
  };

  ViewportTransform(absl::Span<const Node> nodes, double width, double height,
                    double margin = kDefaultViewportMargin);

  Point Apply(double x, double y) const;
  Point Apply(const Node& node) const { return Apply(node.x, node.y); }

  double scale() const { return scale_; }

 private:
  double min_x_ = 0.0;
  double min_y_ = 0.0;
  double margin_;
  double scale_ = 1.0;
};

}  // namespace qvrp

#endif  // QVRP_ROUTING_VIEWPORT_H_
