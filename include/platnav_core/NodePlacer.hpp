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

#ifndef PLATNAV_CORE__NODEPLACER_HPP
#define PLATNAV_CORE__NODEPLACER_HPP

#include <cstddef>
#include <vector>

#include "platnav_core/PlatformTypes.hpp"

namespace platnav
{

/// \brief Spacing rules for nodes along a top edge.
struct NodePlacementParams
{
  float node_spacing{1.5f};        ///< Target distance between interior nodes
  float edge_inset{0.3f};          ///< Inward offset of the two edge nodes
  float min_platform_width{1.0f};  ///< Below this width a single node is placed
};

/**
 * \brief Turns a walkable top edge into platform nodes.
 *
 * Wide edges get a LEFT_EDGE node, a RIGHT_EDGE node, then
 * floor(inner / spacing) evenly spaced SURFACE nodes between them, in that
 * order. Narrow edges get one SURFACE node at their midpoint.
 */
class NodePlacer {
public:
  explicit NodePlacer(const NodePlacementParams & params = NodePlacementParams{})
  : params_(params) {}

  /**
   * \brief Append the nodes of \p edge to \p out.
   * \param edge       Accepted top edge.
   * \param shape      Originating shape, copied into every node.
   * \param is_one_way One-way flag, copied into every node.
   * \param next_id    Id counter; advanced by the number of nodes emitted.
   * \param out        Destination.
   * \return Number of nodes appended.
   */
  std::size_t place(
    const TopEdge & edge,
    ShapeId shape,
    bool is_one_way,
    NodeId & next_id,
    std::vector<PlatformNode> & out) const;

  const NodePlacementParams & params() const {return params_;}

private:
  NodePlacementParams params_;
};

}  // namespace platnav

#endif  // PLATNAV_CORE__NODEPLACER_HPP
