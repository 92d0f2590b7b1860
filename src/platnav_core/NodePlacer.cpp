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


#include "platnav_core/NodePlacer.hpp"

#include <cmath>

namespace platnav
{

std::size_t NodePlacer::place(
  const TopEdge & edge,
  ShapeId shape,
  bool is_one_way,
  NodeId & next_id,
  std::vector<PlatformNode> & out) const
{
  const std::size_t before = out.size();
  auto emit = [&](float x, NodeKind kind) {
      out.push_back(PlatformNode{next_id++, Vec2(x, edge.y), kind, shape, is_one_way});
    };

  const float width = edge.width();
  if (width < params_.min_platform_width) {
    emit(0.5f * (edge.left + edge.right), NodeKind::SURFACE);
    return out.size() - before;
  }

  const float inset = params_.edge_inset;
  emit(edge.left + inset, NodeKind::LEFT_EDGE);
  emit(edge.right - inset, NodeKind::RIGHT_EDGE);

  const float inner = width - 2.0f * inset;
  const int count = static_cast<int>(std::floor(inner / params_.node_spacing));
  if (count > 0) {
    const float step = inner / static_cast<float>(count + 1);
    for (int i = 1; i <= count; ++i) {
      emit(edge.left + inset + step * static_cast<float>(i), NodeKind::SURFACE);
    }
  }
  return out.size() - before;
}

}  // namespace platnav
