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


#include "platnav_core/StaticWorld.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <stack>
#include <stdexcept>
#include <string>
#include <utility>

namespace platnav
{

// -----------------------------------------------------------------------------
// Shape construction
// -----------------------------------------------------------------------------

ShapeId StaticWorld::push_shape_(Shape && s)
{
  for (const auto & path : s.paths) {
    for (const auto & p : path) {
      s.aabb.expand(p);
    }
  }
  shapes_.push_back(std::move(s));
  bvh_dirty_ = true;
  return static_cast<ShapeId>(shapes_.size() - 1);
}

ShapeId StaticWorld::add_box(const Vec2 & center, const Vec2 & size, LayerMask layer)
{
  const AABB2 box = AABB2::from_center_size(center, size);

  Shape s;
  s.kind = ShapeKind::BOX;
  s.layer = layer;
  s.paths.push_back({
      Vec2(box.min.x(), box.min.y()),
      Vec2(box.max.x(), box.min.y()),
      Vec2(box.max.x(), box.max.y()),
      Vec2(box.min.x(), box.max.y())});
  return push_shape_(std::move(s));
}

ShapeId StaticWorld::add_polyline(const std::vector<Vec2> & points, LayerMask layer)
{
  if (points.size() < 2) {
    throw std::invalid_argument(
            "StaticWorld::add_polyline: needs at least 2 points, got " +
            std::to_string(points.size()));
  }
  Shape s;
  s.kind = ShapeKind::POLYLINE;
  s.layer = layer;
  s.paths.push_back(points);
  return push_shape_(std::move(s));
}

ShapeId StaticWorld::add_polygon(
  const std::vector<std::vector<Vec2>> & paths,
  LayerMask layer)
{
  if (paths.empty()) {
    throw std::invalid_argument("StaticWorld::add_polygon: no paths");
  }
  for (std::size_t i = 0; i < paths.size(); ++i) {
    if (paths[i].size() < 3) {
      throw std::invalid_argument(
              "StaticWorld::add_polygon: path " + std::to_string(i) +
              " needs at least 3 points");
    }
  }
  Shape s;
  s.kind = ShapeKind::POLYGON;
  s.layer = layer;
  s.paths = paths;
  return push_shape_(std::move(s));
}

bool StaticWorld::set_enabled(ShapeId id, bool enabled)
{
  if (id >= shapes_.size()) {
    return false;
  }
  if (shapes_[id].enabled != enabled) {
    shapes_[id].enabled = enabled;
    bvh_dirty_ = true;
  }
  return true;
}

bool StaticWorld::is_enabled(ShapeId id) const
{
  return id < shapes_.size() && shapes_[id].enabled;
}

void StaticWorld::clear()
{
  shapes_.clear();
  segments_.clear();
  bvh_.clear();
  bvh_dirty_ = true;
}

// -----------------------------------------------------------------------------
// Segment BVH
// -----------------------------------------------------------------------------

void StaticWorld::ensure_bvh_() const
{
  if (!bvh_dirty_) {
    return;
  }

  struct PrimBox
  {
    Segment seg;
    AABB2 box;
    Vec2 centroid;
  };
  std::vector<PrimBox> prims;

  for (ShapeId id = 0; id < shapes_.size(); ++id) {
    const Shape & s = shapes_[id];
    if (!s.enabled) {
      continue;
    }
    for (const auto & path : s.paths) {
      const std::size_t n = path.size();
      const std::size_t edges = s.closed() ? n : n - 1;
      for (std::size_t i = 0; i < edges; ++i) {
        const Vec2 & a = path[i];
        const Vec2 & b = path[(i + 1) % n];
        AABB2 box;
        box.expand(a);
        box.expand(b);
        prims.push_back({Segment{a, b, id}, box, 0.5f * (a + b)});
      }
    }
  }

  bvh_.clear();
  bvh_.reserve(2 * prims.size());

  std::function<int(int, int)> build = [&](int begin, int end) -> int {
      BVHNode node;
      for (int i = begin; i < end; ++i) {
        node.box.expand(prims[i].box);
      }
      int idx = static_cast<int>(bvh_.size());
      bvh_.push_back(node);

      int count = end - begin;
      if (count <= 4) {
        bvh_[idx].start = begin;
        bvh_[idx].count = count;
        return idx;
      }

      int axis = bvh_[idx].box.longest_axis();
      int mid = (begin + end) / 2;
      std::nth_element(
        prims.begin() + begin, prims.begin() + mid, prims.begin() + end,
        [axis](const PrimBox & A, const PrimBox & B) {
          return A.centroid[axis] < B.centroid[axis];
        });
      int L = build(begin, mid);
      int R = build(mid, end);
      bvh_[idx].left = L;
      bvh_[idx].right = R;
      return idx;
    };

  if (!prims.empty()) {
    build(0, static_cast<int>(prims.size()));
  }

  segments_.clear();
  segments_.reserve(prims.size());
  for (const auto & p : prims) {
    segments_.push_back(p.seg);
  }
  bvh_dirty_ = false;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

std::optional<ShapeId> StaticWorld::containing_shape_(const Vec2 & p, LayerMask mask) const
{
  for (ShapeId id = 0; id < shapes_.size(); ++id) {
    const Shape & s = shapes_[id];
    if (!s.enabled || !s.closed() || (s.layer & mask) == 0 || !s.aabb.contains(p)) {
      continue;
    }
    for (const auto & loop : s.paths) {
      if (point_in_loop(p, loop)) {
        return id;
      }
    }
  }
  return std::nullopt;
}

std::vector<ShapeId> StaticWorld::overlap_box(
  const Vec2 & center,
  const Vec2 & size,
  LayerMask mask) const
{
  std::vector<ShapeId> out;
  const AABB2 query = AABB2::from_center_size(center, size);

  for (ShapeId id = 0; id < shapes_.size(); ++id) {
    const Shape & s = shapes_[id];
    if (!s.enabled || (s.layer & mask) == 0 || !s.aabb.overlaps(query)) {
      continue;
    }

    bool hit = false;
    for (const auto & path : s.paths) {
      const std::size_t n = path.size();
      const std::size_t edges = s.closed() ? n : n - 1;
      for (std::size_t i = 0; i < edges && !hit; ++i) {
        hit = query.intersects_segment(path[i], path[(i + 1) % n]);
      }
      // Query box fully inside the shape.
      if (!hit && s.closed()) {
        hit = point_in_loop(center, path);
      }
      if (hit) {
        break;
      }
    }
    if (hit) {
      out.push_back(id);
    }
  }
  return out;
}

std::optional<RaycastHit> StaticWorld::raycast(
  const Vec2 & origin,
  const Vec2 & direction,
  float max_distance,
  LayerMask mask) const
{
  const float len = direction.norm();
  if (!(len > 0.0f) || max_distance < 0.0f || mask == 0) {
    return std::nullopt;
  }
  const Vec2 d = direction / len;

  if (queries_start_in_shapes_) {
    if (auto inside = containing_shape_(origin, mask)) {
      return RaycastHit{origin, *inside, 0.0f};
    }
  }

  ensure_bvh_();
  if (bvh_.empty()) {
    return std::nullopt;
  }

  bool hit = false;
  float best_t = max_distance;
  ShapeId best_shape = kInvalidShape;
  std::stack<int> st;
  st.push(0);

  while (!st.empty()) {
    int idx = st.top();
    st.pop();
    const BVHNode & n = bvh_[idx];
    if (!n.box.intersects_ray(origin, d, best_t)) {
      continue;
    }
    if (n.is_leaf()) {
      for (int i = 0; i < n.count; ++i) {
        const Segment & seg = segments_[n.start + i];
        if ((shapes_[seg.shape].layer & mask) == 0) {
          continue;
        }
        float t, u;
        if (!ray_segment_intersect(origin, d, seg.a, seg.b, t, u) || t > max_distance) {
          continue;
        }
        if (!hit || t < best_t || (t == best_t && seg.shape < best_shape)) {
          best_t = t;
          best_shape = seg.shape;
          hit = true;
        }
      }
    } else {
      if (n.left >= 0) {st.push(n.left);}
      if (n.right >= 0) {st.push(n.right);}
    }
  }

  if (!hit) {
    return std::nullopt;
  }
  return RaycastHit{origin + best_t * d, best_shape, best_t};
}

std::optional<ShapeInfo> StaticWorld::shape_info(ShapeId id) const
{
  if (!is_enabled(id)) {
    return std::nullopt;
  }
  const Shape & s = shapes_[id];
  return ShapeInfo{s.kind, s.layer, s.paths.size()};
}

bool StaticWorld::shape_path(
  ShapeId id,
  std::size_t path_index,
  std::vector<Vec2> & out) const
{
  out.clear();
  if (!is_enabled(id) || path_index >= shapes_[id].paths.size()) {
    return false;
  }
  const auto & path = shapes_[id].paths[path_index];
  out.assign(path.begin(), path.end());
  return true;
}

}  // namespace platnav
