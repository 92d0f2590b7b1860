// Copyright 2025 Intelligent Robotics Lab
//
// This file is part of the project Easy Navigation (EasyNav in short)
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


#include "platnav_core/WalkLinkBuilder.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace platnav
{

std::size_t WalkLinkBuilder::build(
  const std::vector<PlatformNode> & nodes,
  std::vector<PlatformLink> & links) const
{
  const std::size_t before = links.size();

  // (shape, height bucket) -> node indices, in creation order.
  std::map<std::pair<ShapeId, long>, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const PlatformNode & n = nodes[i];
    if (n.source_shape == kInvalidShape) {
      continue;
    }
    const long bucket = std::lround(n.position.y() / params_.max_y_diff);
    groups[{n.source_shape, bucket}].push_back(i);
  }

  for (auto & [key, indices] : groups) {
    if (indices.size() < 2) {
      continue;
    }
    std::stable_sort(
      indices.begin(), indices.end(),
      [&nodes](std::size_t a, std::size_t b) {
        return nodes[a].position.x() < nodes[b].position.x();
      });

    for (std::size_t i = 0; i + 1 < indices.size(); ++i) {
      const PlatformNode & from = nodes[indices[i]];
      const PlatformNode & to = nodes[indices[i + 1]];

      const float x_gap = std::fabs(to.position.x() - from.position.x());
      const float y_diff = std::fabs(to.position.y() - from.position.y());
      if (x_gap > params_.max_x_gap || y_diff > params_.max_y_diff) {
        continue;
      }

      const float cost = (to.position - from.position).norm();
      links.push_back(PlatformLink{from.id, to.id, LinkKind::WALK, cost});
      links.push_back(PlatformLink{to.id, from.id, LinkKind::WALK, cost});
    }
  }

  return links.size() - before;
}

}  // namespace platnav
