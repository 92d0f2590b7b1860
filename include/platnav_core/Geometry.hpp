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

/**
 * @file Geometry.hpp
 * @brief Low-level 2D geometry utilities for platform shapes: AABB, segment
 *        raycasts and polygon containment.
 *
 * This header is intentionally lightweight and header-only to enable
 * aggressive inlining by the compiler. It provides:
 *  - 2D cross product helper.
 *  - Ray-segment intersection (parametric, both parameters returned).
 *  - AABB with robust ray-box intersection and box-box overlap.
 *  - Even-odd point-in-loop test.
 */

#ifndef PLATNAV_CORE__GEOMETRY_HPP
#define PLATNAV_CORE__GEOMETRY_HPP

#include <Eigen/Core>
#include <limits>
#include <cmath>
#include <algorithm>
#include <vector>

namespace platnav
{

/**
 * @brief 2D vector alias used across PlatNav geometry (x right, y up).
 */
using Vec2 = Eigen::Vector2f;

// -----------------------------------------------------------------------------
// Basic segment geometry
// -----------------------------------------------------------------------------

/**
 * @brief Z component of the 3D cross product of two planar vectors.
 *
 * @param a First vector.
 * @param b Second vector.
 * @return a.x * b.y - a.y * b.x (positive if @p b is counter-clockwise of @p a).
 */
inline float cross2(const Vec2 & a, const Vec2 & b)
{
  return a.x() * b.y() - a.y() * b.x();
}

/**
 * @brief Ray-segment intersection.
 *
 * Solves orig + t * dir = a + u * (b - a). Returns @c true on hit and outputs:
 *  - @p t: parametric distance along the ray (t >= 0).
 *  - @p u: position along the segment in [0, 1].
 *
 * Parallel and collinear configurations are reported as misses.
 *
 * @param orig Ray origin.
 * @param dir Ray direction (not necessarily unit length).
 * @param a Segment start.
 * @param b Segment end.
 * @param t Output ray parameter on hit.
 * @param u Output segment parameter on hit.
 * @return True if the ray crosses the segment with t >= 0.
 */
inline bool ray_segment_intersect(
  const Vec2 & orig,
  const Vec2 & dir,
  const Vec2 & a,
  const Vec2 & b,
  float & t,
  float & u)
{
  const float kEps = 1e-8f;
  const Vec2 e = b - a;
  const float denom = cross2(dir, e);
  if (std::fabs(denom) < kEps) {
    return false;
  }
  const Vec2 ao = a - orig;
  t = cross2(ao, e) / denom;
  u = cross2(ao, dir) / denom;
  if (u < -1e-6f || u > 1.0f + 1e-6f) {
    return false;
  }
  return t >= 0.0f;
}

// -----------------------------------------------------------------------------
// Axis-aligned bounding box (AABB)
// -----------------------------------------------------------------------------

/**
 * @brief Axis-aligned bounding box in the plane.
 *
 * Stores component-wise minima/maxima and provides helpers for:
 *  - Union/expansion with points or other boxes.
 *  - Longest axis query (for BVH splitting).
 *  - Robust ray-box intersection (slabs method).
 *  - Containment and overlap tests.
 */
struct AABB2
{
  /**
   * @brief Minimum corner (x_min, y_min). Initialized to +inf.
   */
  Vec2 min{std::numeric_limits<float>::infinity(),
    std::numeric_limits<float>::infinity()};
  /**
   * @brief Maximum corner (x_max, y_max). Initialized to -inf.
   */
  Vec2 max{-std::numeric_limits<float>::infinity(),
    -std::numeric_limits<float>::infinity()};

  /**
   * @brief Build a box from its center and full size.
   * @param center Box center.
   * @param size Full extent on each axis.
   */
  static inline AABB2 from_center_size(const Vec2 & center, const Vec2 & size)
  {
    AABB2 box;
    box.min = center - 0.5f * size.cwiseAbs();
    box.max = center + 0.5f * size.cwiseAbs();
    return box;
  }

  /**
   * @brief Expand the box to include a point @p p.
   * @param p Point to merge into this AABB.
   */
  inline void expand(const Vec2 & p)
  {
    min = min.cwiseMin(p);
    max = max.cwiseMax(p);
  }

  /**
   * @brief Expand the box to include another box @p b (component-wise union).
   * @param b Other AABB to merge.
   */
  inline void expand(const AABB2 & b)
  {
    min = min.cwiseMin(b.min);
    max = max.cwiseMax(b.max);
  }

  /**
   * @brief Return the index of the longest axis (0=x, 1=y).
   */
  inline int longest_axis() const
  {
    Vec2 d = max - min;
    return d.x() >= d.y() ? 0 : 1;
  }

  /**
   * @brief Robust ray-box intersection (slabs method).
   *
   * Intersects ray (o + t * d) against the box. Handles zero components in
   * direction @p d by checking slab containment on that axis.
   *
   * @param o Ray origin.
   * @param d Ray direction.
   * @param tmax Upper bound for @p t interval (can be +inf).
   * @return True if the ray intersects the box with some t in [0, tmax].
   */
  inline bool intersects_ray(
    const Vec2 & o,
    const Vec2 & d,
    float tmax = 1e30f) const
  {
    const float kEps = 1e-12f;
    float tmin_local = 0.0f;

    for (int i = 0; i < 2; ++i) {
      const float di = d[i];
      const float oi = o[i];
      const float min_i = min[i];
      const float max_i = max[i];

      if (std::fabs(di) < kEps) {
        // Parallel to this slab: must be inside [min_i, max_i]
        if (oi < min_i || oi > max_i) {return false;}
        continue;
      }

      float inv = 1.0f / di;
      float t0 = (min_i - oi) * inv;
      float t1 = (max_i - oi) * inv;
      if (t0 > t1) {std::swap(t0, t1);}

      if (t0 > tmin_local) {tmin_local = t0;}
      if (t1 < tmax) {tmax = t1;}

      if (tmax < tmin_local) {return false;}
    }
    return tmax >= tmin_local && tmax >= 0.0f;
  }

  /**
   * @brief Closed containment test.
   * @param p Query point.
   * @return True if @p p lies inside [min, max] on both axes.
   */
  inline bool contains(const Vec2 & p) const
  {
    return p.x() >= min.x() && p.x() <= max.x() &&
           p.y() >= min.y() && p.y() <= max.y();
  }

  /**
   * @brief Closed overlap test between two boxes (touching counts).
   * @param b Other box.
   */
  inline bool overlaps(const AABB2 & b) const
  {
    return min.x() <= b.max.x() && max.x() >= b.min.x() &&
           min.y() <= b.max.y() && max.y() >= b.min.y();
  }

  /**
   * @brief Test whether segment [a, b] touches the box.
   *
   * Reuses the slab test with the unnormalized segment direction and tmax = 1.
   */
  inline bool intersects_segment(const Vec2 & a, const Vec2 & b) const
  {
    if (contains(a) || contains(b)) {return true;}
    return intersects_ray(a, b - a, 1.0f);
  }
};

// -----------------------------------------------------------------------------
// Polygon helpers
// -----------------------------------------------------------------------------

/**
 * @brief Even-odd point-in-polygon test over a closed loop.
 *
 * Points exactly on the boundary may be classified either way.
 *
 * @param p Query point.
 * @param loop Closed loop vertices (last vertex connects to the first).
 * @return True if @p p is inside @p loop.
 */
inline bool point_in_loop(const Vec2 & p, const std::vector<Vec2> & loop)
{
  bool inside = false;
  const std::size_t n = loop.size();
  if (n < 3) {
    return false;
  }
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2 & a = loop[i];
    const Vec2 & b = loop[j];
    if ((a.y() > p.y()) != (b.y() > p.y())) {
      const float x_cross = a.x() + (p.y() - a.y()) * (b.x() - a.x()) / (b.y() - a.y());
      if (p.x() < x_cross) {
        inside = !inside;
      }
    }
  }
  return inside;
}

}  // namespace platnav

#endif  // PLATNAV_CORE__GEOMETRY_HPP
