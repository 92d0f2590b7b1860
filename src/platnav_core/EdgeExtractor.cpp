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


#include "platnav_core/EdgeExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace platnav
{

EdgeExtractor::EdgeExtractor(
  const ShapeQueryProvider & provider,
  const EdgeExtractionParams & params)
: provider_(provider), params_(params)
{
}

bool EdgeExtractor::is_walkable(
  const Vec2 & p1, const Vec2 & p2,
  LayerMask platform_mask) const
{
  const float dx = std::fabs(p2.x() - p1.x());
  const float dy = std::fabs(p2.y() - p1.y());

  if (dx < params_.min_edge_span) {
    return false;
  }
  if (dy / dx > params_.max_slope) {
    return false;
  }

  const Vec2 mid = 0.5f * (p1 + p2);
  const Vec2 origin(mid.x(), mid.y() + params_.standing_height);
  auto hit = provider_.raycast(origin, Vec2(0.0f, -1.0f), params_.ray_length, platform_mask);
  if (!hit) {
    return false;
  }

  return std::fabs(hit->point.y() - mid.y()) < params_.surface_tolerance &&
         (origin.y() - hit->point.y()) > params_.clearance_ratio * params_.standing_height;
}

void EdgeExtractor::extract_path(
  const std::vector<Vec2> & path,
  bool closed,
  LayerMask platform_mask,
  std::vector<TopEdge> & out) const
{
  const std::size_t n = path.size();
  if (n < (closed ? 3u : 2u)) {
    return;
  }

  const std::size_t edges = closed ? n : n - 1;
  for (std::size_t i = 0; i < edges; ++i) {
    const Vec2 & p1 = path[i];
    const Vec2 & p2 = path[(i + 1) % n];
    if (!is_walkable(p1, p2, platform_mask)) {
      continue;
    }
    out.push_back(
      TopEdge{
        std::min(p1.x(), p2.x()),
        std::max(p1.x(), p2.x()),
        0.5f * (p1.y() + p2.y())});
  }
}

std::vector<TopEdge> EdgeExtractor::extract_shape(ShapeId id, LayerMask platform_mask) const
{
  std::vector<TopEdge> raw;
  auto info = provider_.shape_info(id);
  if (!info) {
    return raw;
  }

  const bool closed = info->kind != ShapeKind::POLYLINE;
  std::vector<Vec2> path;
  for (std::size_t i = 0; i < info->path_count; ++i) {
    if (!provider_.shape_path(id, i, path)) {
      continue;
    }
    extract_path(path, closed, platform_mask, raw);
  }

  return deduplicate_close_edges(
    merge_adjacent_edges(std::move(raw), params_.merge_threshold),
    params_.dedup_threshold);
}

// -----------------------------------------------------------------------------
// Post-processing
// -----------------------------------------------------------------------------

std::vector<TopEdge> merge_adjacent_edges(std::vector<TopEdge> edges, float threshold)
{
  if (edges.size() <= 1) {
    return edges;
  }

  std::stable_sort(
    edges.begin(), edges.end(),
    [](const TopEdge & a, const TopEdge & b) {
      if (a.y != b.y) {return a.y > b.y;}
      return a.left < b.left;
    });

  std::vector<TopEdge> merged;
  TopEdge current = edges.front();
  for (std::size_t i = 1; i < edges.size(); ++i) {
    const TopEdge & next = edges[i];
    if (std::fabs(current.y - next.y) < threshold &&
      next.left <= current.right + threshold)
    {
      current = TopEdge{
        std::min(current.left, next.left),
        std::max(current.right, next.right),
        0.5f * (current.y + next.y)};
    } else {
      merged.push_back(current);
      current = next;
    }
  }
  merged.push_back(current);
  return merged;
}

std::vector<TopEdge> deduplicate_close_edges(std::vector<TopEdge> edges, float threshold)
{
  if (edges.size() <= 1) {
    return edges;
  }

  std::stable_sort(
    edges.begin(), edges.end(),
    [](const TopEdge & a, const TopEdge & b) {return a.left < b.left;});

  std::vector<TopEdge> kept;
  for (const auto & edge : edges) {
    bool duplicate = false;
    for (auto & existing : kept) {
      const bool x_overlap = edge.left < existing.right && edge.right > existing.left;
      const bool y_close = std::fabs(edge.y - existing.y) < threshold;
      if (x_overlap && y_close) {
        if (edge.y > existing.y) {
          existing = edge;
        }
        duplicate = true;
        break;
      }
    }
    if (!duplicate) {
      kept.push_back(edge);
    }
  }
  return kept;
}

}  // namespace platnav
