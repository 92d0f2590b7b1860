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


#include "platnav_core/SpatialGrid.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace platnav
{

/** @cond INTERNAL */
namespace
{

// Cell coordinates are clamped so ring arithmetic never overflows.
constexpr double kMaxCellCoord = 1.0e9;

inline bool valid_max_distance(float max_distance)
{
  return max_distance > 0.0f;  // false for NaN too
}

}  // namespace
/** @endcond */

SpatialGrid::SpatialGrid(float cell_size)
: cell_size_(cell_size)
{
  if (!(cell_size > 0.0f) || !std::isfinite(cell_size)) {
    throw std::invalid_argument(
            "SpatialGrid: cell_size must be > 0, got " + std::to_string(cell_size));
  }
  inv_cell_size_ = 1.0f / cell_size_;
}

CellKey SpatialGrid::cell_of(const Vec2 & p) const
{
  auto axis = [this](float v) -> int32_t {
      double c = std::floor(static_cast<double>(v) * static_cast<double>(inv_cell_size_));
      c = std::clamp(c, -kMaxCellCoord, kMaxCellCoord);
      return static_cast<int32_t>(c);
    };
  return CellKey{axis(p.x()), axis(p.y())};
}

void SpatialGrid::clear()
{
  xs_.clear();
  ys_.clear();
  buckets_.clear();
  min_cell_ = CellKey{};
  max_cell_ = CellKey{};
}

void SpatialGrid::build(const std::vector<PlatformNode> & nodes)
{
  clear();
  xs_.reserve(nodes.size());
  ys_.reserve(nodes.size());
  buckets_.reserve(nodes.size() / 2 + 1);

  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const Vec2 & p = nodes[i].position;
    xs_.push_back(p.x());
    ys_.push_back(p.y());

    const CellKey k = cell_of(p);
    buckets_[k].push_back(static_cast<uint32_t>(i));
    if (i == 0) {
      min_cell_ = k;
      max_cell_ = k;
    } else {
      min_cell_.x = std::min(min_cell_.x, k.x);
      min_cell_.y = std::min(min_cell_.y, k.y);
      max_cell_.x = std::max(max_cell_.x, k.x);
      max_cell_.y = std::max(max_cell_.y, k.y);
    }
  }
}

bool SpatialGrid::occupied_(int64_t cx, int64_t cy) const
{
  return cx >= min_cell_.x && cx <= max_cell_.x &&
         cy >= min_cell_.y && cy <= max_cell_.y;
}

void SpatialGrid::visit_cell_nearest_(
  int64_t cx, int64_t cy, const Vec2 & p, float max_sq,
  float & best_sq, std::optional<std::size_t> & best) const
{
  if (!occupied_(cx, cy)) {
    return;
  }
  auto it = buckets_.find(CellKey{static_cast<int32_t>(cx), static_cast<int32_t>(cy)});
  if (it == buckets_.end()) {
    return;
  }
  for (uint32_t idx : it->second) {
    const float d2 = SpatialGrid::squared_distance(xs_[idx], ys_[idx], p);
    if (!(d2 < max_sq)) {
      continue;
    }
    if (!best || d2 < best_sq || (d2 == best_sq && idx < *best)) {
      best_sq = d2;
      best = idx;
    }
  }
}

std::optional<std::size_t> SpatialGrid::find_nearest(const Vec2 & p, float max_distance) const
{
  std::optional<std::size_t> best;
  if (empty() || !valid_max_distance(max_distance)) {
    return best;
  }

  const float max_sq = max_distance * max_distance;
  float best_sq = std::numeric_limits<float>::infinity();

  const CellKey c = cell_of(p);
  const int64_t cx = c.x;
  const int64_t cy = c.y;

  // Rings closer than the occupied bounds are empty.
  int64_t r = 0;
  r = std::max<int64_t>(r, min_cell_.x - cx);
  r = std::max<int64_t>(r, cx - max_cell_.x);
  r = std::max<int64_t>(r, min_cell_.y - cy);
  r = std::max<int64_t>(r, cy - max_cell_.y);

  for (;; ++r) {
    if (r > 0) {
      // Block of rings [0, r-1] already covers every occupied cell.
      const int64_t in = r - 1;
      if (cx - in <= min_cell_.x && cx + in >= max_cell_.x &&
        cy - in <= min_cell_.y && cy + in >= max_cell_.y)
      {
        break;
      }

      // Distance from p to the outside of that block bounds every node in ring r.
      const float x0 = static_cast<float>(cx - in) * cell_size_;
      const float x1 = static_cast<float>(cx + in + 1) * cell_size_;
      const float y0 = static_cast<float>(cy - in) * cell_size_;
      const float y1 = static_cast<float>(cy + in + 1) * cell_size_;
      float lb = std::min(
        std::min(p.x() - x0, x1 - p.x()),
        std::min(p.y() - y0, y1 - p.y()));
      lb -= 1e-4f * cell_size_ + 1e-6f * (std::fabs(p.x()) + std::fabs(p.y()));
      lb = std::max(0.0f, lb);

      if (lb >= max_distance) {
        break;
      }
      if (best && lb * lb > best_sq) {
        break;
      }
    }

    if (r == 0) {
      visit_cell_nearest_(cx, cy, p, max_sq, best_sq, best);
      continue;
    }

    // Top and bottom rows of the ring, clamped to occupied columns.
    const int64_t x_lo = std::max<int64_t>(cx - r, min_cell_.x);
    const int64_t x_hi = std::min<int64_t>(cx + r, max_cell_.x);
    for (int64_t x = x_lo; x <= x_hi; ++x) {
      visit_cell_nearest_(x, cy - r, p, max_sq, best_sq, best);
      visit_cell_nearest_(x, cy + r, p, max_sq, best_sq, best);
    }
    // Left and right columns, excluding the corners.
    const int64_t y_lo = std::max<int64_t>(cy - r + 1, min_cell_.y);
    const int64_t y_hi = std::min<int64_t>(cy + r - 1, max_cell_.y);
    for (int64_t y = y_lo; y <= y_hi; ++y) {
      visit_cell_nearest_(cx - r, y, p, max_sq, best_sq, best);
      visit_cell_nearest_(cx + r, y, p, max_sq, best_sq, best);
    }
  }

  return best;
}

void SpatialGrid::find_in_range(
  const Vec2 & p, float radius,
  std::vector<std::size_t> & out) const
{
  out.clear();
  for_each_in_range(p, radius, [&out](std::size_t idx) {out.push_back(idx);});
  std::sort(out.begin(), out.end());
}

SpatialGridStats SpatialGrid::stats() const
{
  SpatialGridStats s;
  s.cells = buckets_.size();
  s.nodes = xs_.size();
  for (const auto & [key, bucket] : buckets_) {
    s.max_bucket = std::max(s.max_bucket, bucket.size());
  }
  if (s.cells > 0) {
    s.avg_bucket = static_cast<float>(s.nodes) / static_cast<float>(s.cells);
  }
  return s;
}

// -----------------------------------------------------------------------------
// Linear fallbacks
// -----------------------------------------------------------------------------

std::optional<std::size_t> find_nearest_linear(
  const std::vector<PlatformNode> & nodes,
  const Vec2 & p,
  float max_distance)
{
  std::optional<std::size_t> best;
  if (!valid_max_distance(max_distance)) {
    return best;
  }
  const float max_sq = max_distance * max_distance;
  float best_sq = std::numeric_limits<float>::infinity();
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const float d2 = SpatialGrid::squared_distance(nodes[i].position.x(), nodes[i].position.y(), p);
    if (d2 < max_sq && (!best || d2 < best_sq)) {
      best_sq = d2;
      best = i;
    }
  }
  return best;
}

void find_in_range_linear(
  const std::vector<PlatformNode> & nodes,
  const Vec2 & p,
  float radius,
  std::vector<std::size_t> & out)
{
  out.clear();
  if (!(radius >= 0.0f)) {
    return;
  }
  const float r_sq = radius * radius;
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    if (SpatialGrid::squared_distance(nodes[i].position.x(), nodes[i].position.y(), p) <= r_sq) {
      out.push_back(i);
    }
  }
}

}  // namespace platnav
