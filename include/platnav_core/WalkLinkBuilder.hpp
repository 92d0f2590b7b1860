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

#ifndef PLATNAV_CORE__WALKLINKBUILDER_HPP
#define PLATNAV_CORE__WALKLINKBUILDER_HPP

#include <cstddef>
#include <vector>

#include "platnav_core/PlatformTypes.hpp"

namespace platnav
{

/// \brief Bounds for linking two neighbouring nodes of the same surface.
struct WalkLinkParams
{
  float max_x_gap{3.0f};   ///< Largest horizontal gap bridged by a walk link
  float max_y_diff{0.5f};  ///< Largest height difference; also the height bucket size
};

/**
 * \brief Connects nodes of the same surface with bidirectional WALK links.
 *
 * Nodes are grouped by (source shape, round(y / max_y_diff)) and each group
 * is sorted by x. Only consecutive nodes of a group are linked, so every
 * surface becomes a path graph. Nodes without a valid source shape are
 * ignored. Group iteration order is fixed, so the output is deterministic.
 */
class WalkLinkBuilder {
public:
  explicit WalkLinkBuilder(const WalkLinkParams & params = WalkLinkParams{})
  : params_(params) {}

  /**
   * \brief Append the walk links between \p nodes to \p links.
   * \return Number of links appended (always even).
   */
  std::size_t build(
    const std::vector<PlatformNode> & nodes,
    std::vector<PlatformLink> & links) const;

  const WalkLinkParams & params() const {return params_;}

private:
  WalkLinkParams params_;
};

}  // namespace platnav

#endif  // PLATNAV_CORE__WALKLINKBUILDER_HPP
