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

#ifndef PLATNAV_CORE__PLATFORMTYPES_HPP
#define PLATNAV_CORE__PLATFORMTYPES_HPP

/**
 * \file
 * \brief Node, link and edge records of the platform graph.
 */

#include <cstdint>
#include <limits>

#include "platnav_core/Geometry.hpp"
#include "platnav_core/ShapeQuery.hpp"

namespace platnav
{

/// \brief Unique id of a node within one generated graph.
using NodeId = uint32_t;

/// \brief Sentinel for "no node".
inline constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

/**
 * \brief Role of a node on its surface.
 *
 * LEFT_EDGE / RIGHT_EDGE mark surface boundaries used by jump and fall-off
 * logic. ONE_WAY is reserved for consumers; the generator flags one-way
 * surfaces through ::platnav::PlatformNode::is_one_way.
 */
enum class NodeKind : uint8_t { SURFACE = 0, LEFT_EDGE = 1, RIGHT_EDGE = 2, ONE_WAY = 3 };

/**
 * \brief Traversal type of a link.
 *
 * The generator only emits WALK. The other kinds are added by the movement
 * solver through ::platnav::PlatformGraphGenerator::add_link().
 */
enum class LinkKind : uint8_t { WALK = 0, JUMP = 1, FALL = 2, DROP_THROUGH = 3 };

/**
 * \brief A point on a walkable surface.
 */
struct PlatformNode
{
  NodeId id{kInvalidNode};               ///< Unique id (assigned in creation order)
  Vec2 position{0.0f, 0.0f};             ///< World position; y is the surface height
  NodeKind kind{NodeKind::SURFACE};      ///< Role on the surface
  ShapeId source_shape{kInvalidShape};   ///< Originating shape (handle only)
  bool is_one_way{false};                ///< True if the shape is a one-way platform
};

/**
 * \brief A directed traversal edge between two nodes.
 */
struct PlatformLink
{
  NodeId from{kInvalidNode};       ///< Source node id
  NodeId to{kInvalidNode};         ///< Target node id
  LinkKind kind{LinkKind::WALK};   ///< Traversal type
  float cost{0.0f};                ///< Non-negative traversal cost
};

/**
 * \brief Walkable top edge of a shape: horizontal extent plus height.
 */
struct TopEdge
{
  float left{0.0f};   ///< Minimum x
  float right{0.0f};  ///< Maximum x
  float y{0.0f};      ///< Surface height (edge midpoint)

  /// \return right - left.
  inline float width() const {return right - left;}
};

/// \brief Human-readable name of a node kind ("surface", "left_edge", ...).
const char * to_string(NodeKind kind);

/// \brief Human-readable name of a link kind ("walk", "jump", ...).
const char * to_string(LinkKind kind);

}  // namespace platnav

#endif  // PLATNAV_CORE__PLATFORMTYPES_HPP
