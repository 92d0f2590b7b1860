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

#ifndef PLATNAV_CORE__SPATIALGRID_HPP
#define PLATNAV_CORE__SPATIALGRID_HPP

/**
 * \file
 * \brief Uniform bucket grid over node positions for nearest and range queries.
 *
 * The grid is a derived view: it copies node positions at build time and is
 * rebuilt whole whenever the node list changes. Query results are node
 * indices into the vector passed to ::platnav::SpatialGrid::build().
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

#include "platnav_core/Geometry.hpp"
#include "platnav_core/PlatformTypes.hpp"

namespace platnav
{

/// \brief Integer cell coordinates: floor(position / cell_size) per axis.
struct CellKey
{
  int32_t x{0};
  int32_t y{0};

  bool operator==(const CellKey & o) const {return x == o.x && y == o.y;}
};

/// \brief Hash for ::platnav::CellKey.
struct CellKeyHash
{
  size_t operator()(const CellKey & k) const
  {
    return static_cast<size_t>(static_cast<uint32_t>(k.x)) * 73856093u ^
           static_cast<size_t>(static_cast<uint32_t>(k.y)) * 19349663u;
  }
};

/// \brief Occupancy summary of a built grid (for logs and tuning).
struct SpatialGridStats
{
  std::size_t cells{0};        ///< Non-empty buckets
  std::size_t nodes{0};        ///< Indexed nodes
  std::size_t max_bucket{0};   ///< Largest bucket size
  float avg_bucket{0.0f};      ///< nodes / cells (0 when empty)
};

/**
 * \brief Spatial hash of node positions.
 *
 * Nearest search visits rings of cells outward from the query cell and
 * stops once no unvisited cell can hold a closer node. Range search visits
 * only cells whose square intersects the query disk.
 *
 * Comparison rules, shared with the linear-scan helpers below:
 *  - a node is a nearest candidate when its distance is strictly below
 *    \c max_distance; equal distances resolve to the lower index;
 *  - a node is in range when its distance is at most \c radius.
 */
class SpatialGrid {
public:
  /**
   * \param cell_size Edge length of a square cell.
   * \throws std::invalid_argument if \p cell_size is not strictly positive.
   */
  explicit SpatialGrid(float cell_size);

  /// \brief Rebuild from scratch over \p nodes (indices refer to this vector).
  void build(const std::vector<PlatformNode> & nodes);

  /// \brief Drop every bucket. The cell size is kept.
  void clear();

  /// \return True if nothing is indexed.
  inline bool empty() const {return xs_.empty();}

  /// \return Number of indexed nodes.
  inline std::size_t size() const {return xs_.size();}

  inline float cell_size() const {return cell_size_;}

  /// \return Cell containing \p p.
  CellKey cell_of(const Vec2 & p) const;

  /**
   * \brief Index of the node closest to \p p.
   * \return std::nullopt if the grid is empty or no node is closer than \p max_distance.
   */
  std::optional<std::size_t> find_nearest(
    const Vec2 & p,
    float max_distance = std::numeric_limits<float>::infinity()) const;

  /**
   * \brief Indices of every node within \p radius of \p p, ascending.
   *
   * \p out is cleared first; the call allocates nothing beyond its growth.
   * A negative radius yields no results.
   */
  void find_in_range(const Vec2 & p, float radius, std::vector<std::size_t> & out) const;

  /**
   * \brief Call \p fn(index) for every node within \p radius of \p p.
   *
   * Visiting order follows the buckets and is not sorted.
   */
  template<typename Fn>
  void for_each_in_range(const Vec2 & p, float radius, Fn && fn) const
  {
    if (empty() || !(radius >= 0.0f)) {
      return;
    }
    const float r_sq = radius * radius;
    const CellKey lo = cell_of(p - Vec2(radius, radius));
    const CellKey hi = cell_of(p + Vec2(radius, radius));

    const int64_t x_lo = std::max<int64_t>(lo.x, min_cell_.x);
    const int64_t x_hi = std::min<int64_t>(hi.x, max_cell_.x);
    const int64_t y_lo = std::max<int64_t>(lo.y, min_cell_.y);
    const int64_t y_hi = std::min<int64_t>(hi.y, max_cell_.y);
    const float pad = 1e-3f * cell_size_;

    for (int64_t y = y_lo; y <= y_hi; ++y) {
      for (int64_t x = x_lo; x <= x_hi; ++x) {
        // Skip cells whose (slightly padded) square misses the disk.
        const float x0 = static_cast<float>(x) * cell_size_;
        const float y0 = static_cast<float>(y) * cell_size_;
        const float qx = std::clamp(p.x(), x0 - pad, x0 + cell_size_ + pad);
        const float qy = std::clamp(p.y(), y0 - pad, y0 + cell_size_ + pad);
        if (squared_distance(qx, qy, p) > r_sq) {
          continue;
        }
        auto it = buckets_.find(CellKey{static_cast<int32_t>(x), static_cast<int32_t>(y)});
        if (it == buckets_.end()) {
          continue;
        }
        for (uint32_t idx : it->second) {
          if (squared_distance(xs_[idx], ys_[idx], p) <= r_sq) {
            fn(static_cast<std::size_t>(idx));
          }
        }
      }
    }
  }

  /// \brief Squared distance from (x, y) to \p p, as every query computes it.
  static inline float squared_distance(float x, float y, const Vec2 & p)
  {
    const float dx = x - p.x();
    const float dy = y - p.y();
    return dx * dx + dy * dy;
  }

  /// \return Bucket occupancy summary.
  SpatialGridStats stats() const;

private:
  bool occupied_(int64_t cx, int64_t cy) const;
  void visit_cell_nearest_(
    int64_t cx, int64_t cy, const Vec2 & p, float max_sq,
    float & best_sq, std::optional<std::size_t> & best) const;

  float cell_size_;
  float inv_cell_size_;

  // Structure-of-arrays copy of the indexed positions.
  std::vector<float> xs_;
  std::vector<float> ys_;

  std::unordered_map<CellKey, std::vector<uint32_t>, CellKeyHash> buckets_;
  CellKey min_cell_;
  CellKey max_cell_;
};

/**
 * \brief Linear-scan nearest search with the same rules as ::platnav::SpatialGrid.
 * \return Index into \p nodes, or std::nullopt.
 */
std::optional<std::size_t> find_nearest_linear(
  const std::vector<PlatformNode> & nodes,
  const Vec2 & p,
  float max_distance = std::numeric_limits<float>::infinity());

/// \brief Linear-scan range search with the same rules as ::platnav::SpatialGrid.
void find_in_range_linear(
  const std::vector<PlatformNode> & nodes,
  const Vec2 & p,
  float radius,
  std::vector<std::size_t> & out);

}  // namespace platnav

#endif  // PLATNAV_CORE__SPATIALGRID_HPP
