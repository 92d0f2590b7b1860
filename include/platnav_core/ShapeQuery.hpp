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

#ifndef PLATNAV_CORE__SHAPEQUERY_HPP
#define PLATNAV_CORE__SHAPEQUERY_HPP

/**
 * \file
 * \brief Collaborator contract between the graph generator and a 2D physics world.
 *
 * The generator never talks to an engine directly. Each target engine provides
 * an adapter implementing ::platnav::ShapeQueryProvider; ::platnav::StaticWorld
 * is the in-memory adapter shipped with the library.
 */

#include <cstdint>
#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

#include "platnav_core/Geometry.hpp"

namespace platnav
{

/// \brief Non-owning handle to a static shape in the provider.
using ShapeId = uint32_t;
/// \brief 32-bit layer bitmask (one bit per physics layer).
using LayerMask = uint32_t;

/// \brief Sentinel for "no shape".
inline constexpr ShapeId kInvalidShape = std::numeric_limits<ShapeId>::max();

/**
 * \brief Geometric family of a static shape.
 *
 * - BOX: one closed path with the four corners (counter-clockwise).
 * - POLYLINE: one open path; its last point does not connect to the first.
 * - POLYGON: one or more closed loops sharing the same identity.
 */
enum class ShapeKind : uint8_t { BOX = 0, POLYLINE = 1, POLYGON = 2 };

/**
 * \brief Static description of a shape, as reported by the provider.
 */
struct ShapeInfo
{
  ShapeKind kind{ShapeKind::BOX};  ///< Geometric family
  LayerMask layer{0};              ///< Layer bit the shape lives on
  std::size_t path_count{0};       ///< Number of enumerable paths
};

/**
 * \brief Result of a successful raycast.
 */
struct RaycastHit
{
  Vec2 point{0.0f, 0.0f};        ///< World coordinates of the hit
  ShapeId shape{kInvalidShape};  ///< Shape hit
  float distance{0.0f};          ///< Distance from the ray origin
};

/**
 * \brief Abstract 2D shape query interface consumed by the generator.
 *
 * Implementations must be deterministic for unchanged geometry. All queries
 * are filtered by a layer bitmask: a shape participates when
 * `(shape_layer & mask) != 0`.
 */
class ShapeQueryProvider {
public:
  virtual ~ShapeQueryProvider() = default;

  /**
   * \brief Return the shapes overlapping an axis-aligned box.
   * \param center Box center (world).
   * \param size   Full box size.
   * \param mask   Layer filter.
   * \return Shape handles, in a deterministic order.
   */
  virtual std::vector<ShapeId> overlap_box(
    const Vec2 & center,
    const Vec2 & size,
    LayerMask mask) const = 0;

  /**
   * \brief Cast a ray and return the closest hit.
   * \param origin       Ray origin (world).
   * \param direction    Ray direction (normalized by the implementation).
   * \param max_distance Maximum hit distance.
   * \param mask         Layer filter.
   * \return The closest hit, or std::nullopt.
   */
  virtual std::optional<RaycastHit> raycast(
    const Vec2 & origin,
    const Vec2 & direction,
    float max_distance,
    LayerMask mask) const = 0;

  /**
   * \brief Describe a shape.
   * \return std::nullopt if \p id is unknown or no longer valid.
   */
  virtual std::optional<ShapeInfo> shape_info(ShapeId id) const = 0;

  /**
   * \brief Copy one path of a shape, in world coordinates, into \p out.
   *
   * \p out is cleared first so callers can reuse one buffer across shapes.
   *
   * \return false if the shape or the path index is invalid.
   */
  virtual bool shape_path(
    ShapeId id,
    std::size_t path_index,
    std::vector<Vec2> & out) const = 0;
};

}  // namespace platnav

#endif  // PLATNAV_CORE__SHAPEQUERY_HPP
