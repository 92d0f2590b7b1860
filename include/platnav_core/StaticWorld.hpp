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

#ifndef PLATNAV_CORE__STATICWORLD_HPP
#define PLATNAV_CORE__STATICWORLD_HPP

/**
 * \file
 * \brief In-memory static shape world implementing ::platnav::ShapeQueryProvider.
 *
 * Shapes are stored as world-space paths. Raycasts traverse a BVH built over
 * every boundary segment of the enabled shapes; the BVH is rebuilt lazily on
 * the first query after a mutation.
 */

#include <cstddef>
#include <optional>
#include <vector>

#include "platnav_core/Geometry.hpp"
#include "platnav_core/ShapeQuery.hpp"

namespace platnav
{

/**
 * \brief Owning container of static 2D shapes with layer-filtered queries.
 *
 * Shape ids are assigned in insertion order starting at 0 and are never
 * reused. Disabled shapes keep their id but are invisible to every query.
 */
class StaticWorld : public ShapeQueryProvider {
public:
  StaticWorld() = default;

  /**
   * \brief Add an axis-aligned box.
   * \param center Box center (world).
   * \param size   Full box size (absolute value is used).
   * \param layer  Layer bit of the shape.
   * \return Id of the new shape.
   */
  ShapeId add_box(const Vec2 & center, const Vec2 & size, LayerMask layer);

  /**
   * \brief Add an open chain of segments.
   * \throws std::invalid_argument if \p points has fewer than 2 points.
   */
  ShapeId add_polyline(const std::vector<Vec2> & points, LayerMask layer);

  /**
   * \brief Add a polygon made of one or more closed loops.
   * \throws std::invalid_argument if \p paths is empty or a loop has fewer than 3 points.
   */
  ShapeId add_polygon(const std::vector<std::vector<Vec2>> & paths, LayerMask layer);

  /// \brief Enable or disable a shape. \return false if \p id is unknown.
  bool set_enabled(ShapeId id, bool enabled);

  /// \return True if \p id exists and is enabled.
  bool is_enabled(ShapeId id) const;

  /// \return Number of shapes ever added (enabled or not).
  inline std::size_t size() const {return shapes_.size();}

  /// \brief Remove every shape. Ids restart at 0.
  void clear();

  /**
   * \brief Whether a ray starting inside a closed shape reports a hit at its origin.
   *
   * Enabled by default, matching common 2D physics engines.
   */
  void set_queries_start_in_shapes(bool value) {queries_start_in_shapes_ = value;}
  bool queries_start_in_shapes() const {return queries_start_in_shapes_;}

  std::vector<ShapeId> overlap_box(
    const Vec2 & center,
    const Vec2 & size,
    LayerMask mask) const override;

  std::optional<RaycastHit> raycast(
    const Vec2 & origin,
    const Vec2 & direction,
    float max_distance,
    LayerMask mask) const override;

  std::optional<ShapeInfo> shape_info(ShapeId id) const override;

  bool shape_path(
    ShapeId id,
    std::size_t path_index,
    std::vector<Vec2> & out) const override;

private:
  struct Shape
  {
    ShapeKind kind{ShapeKind::BOX};
    LayerMask layer{0};
    bool enabled{true};
    std::vector<std::vector<Vec2>> paths;
    AABB2 aabb;

    inline bool closed() const {return kind != ShapeKind::POLYLINE;}
  };

  /// \brief Boundary segment, the BVH primitive.
  struct Segment
  {
    Vec2 a;
    Vec2 b;
    ShapeId shape;
  };

  /// \brief Node of the segment BVH (leaf when count > 0).
  struct BVHNode
  {
    AABB2 box;
    int left{-1};
    int right{-1};
    int start{0};
    int count{0};
    bool is_leaf() const {return count > 0;}
  };

  ShapeId push_shape_(Shape && s);
  void ensure_bvh_() const;
  std::optional<ShapeId> containing_shape_(const Vec2 & p, LayerMask mask) const;

  std::vector<Shape> shapes_;
  bool queries_start_in_shapes_{true};

  mutable std::vector<Segment> segments_;
  mutable std::vector<BVHNode> bvh_;
  mutable bool bvh_dirty_{true};
};

}  // namespace platnav

#endif  // PLATNAV_CORE__STATICWORLD_HPP
