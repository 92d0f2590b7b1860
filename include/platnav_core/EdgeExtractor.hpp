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

#ifndef PLATNAV_CORE__EDGEEXTRACTOR_HPP
#define PLATNAV_CORE__EDGEEXTRACTOR_HPP

/**
 * \file
 * \brief Walkable top-edge extraction from shape outlines.
 */

#include <vector>

#include "platnav_core/Geometry.hpp"
#include "platnav_core/PlatformTypes.hpp"
#include "platnav_core/ShapeQuery.hpp"

namespace platnav
{

/**
 * \brief Tunable thresholds of the top-edge heuristic.
 */
struct EdgeExtractionParams
{
  float min_edge_span{0.1f};       ///< Minimum horizontal span of an edge
  float max_slope{0.5f};           ///< Maximum |dy/dx| of a walkable edge
  float standing_height{1.0f};     ///< Probe height above the edge midpoint
  float ray_length{1.5f};          ///< Length of the downward probe ray
  float surface_tolerance{0.2f};   ///< Max |hit.y - mid.y| for a valid hit
  float clearance_ratio{0.8f};     ///< Required free fall, as a fraction of standing_height
  float merge_threshold{0.1f};     ///< Height / gap tolerance when merging edges
  float dedup_threshold{0.5f};     ///< Height tolerance when deduplicating edges
};

/**
 * \brief Classifies outline segments as walkable top edges.
 *
 * A segment is walkable when it is wide enough, gentle enough, and a
 * downward probe ray cast from above its midpoint lands on it with enough
 * free space between the probe origin and the surface. The probe is what
 * rejects bottom and interior edges: their probe starts inside the solid
 * (hit at the origin) or lands on a different surface.
 */
class EdgeExtractor {
public:
  /**
   * \param provider Shape world used for probe raycasts. Must outlive the extractor.
   * \param params   Thresholds.
   */
  explicit EdgeExtractor(
    const ShapeQueryProvider & provider,
    const EdgeExtractionParams & params = EdgeExtractionParams{});

  /**
   * \brief Walkable edges of one shape, merged and deduplicated.
   *
   * Raw edges of every path of the shape are pooled before post-processing.
   *
   * \param id            Shape to process.
   * \param platform_mask Layers the probe rays may hit.
   * \return Accepted edges; empty for invalid shapes or degenerate paths.
   */
  std::vector<TopEdge> extract_shape(ShapeId id, LayerMask platform_mask) const;

  /**
   * \brief Append the raw walkable edges of a single path to \p out.
   *
   * Closed paths wrap from the last point to the first and need at least
   * 3 points; open paths need at least 2.
   */
  void extract_path(
    const std::vector<Vec2> & path,
    bool closed,
    LayerMask platform_mask,
    std::vector<TopEdge> & out) const;

  /// \brief Probe test for one segment.
  bool is_walkable(const Vec2 & p1, const Vec2 & p2, LayerMask platform_mask) const;

  const EdgeExtractionParams & params() const {return params_;}

private:
  const ShapeQueryProvider & provider_;
  EdgeExtractionParams params_;
};

/**
 * \brief Merge edges at nearly the same height that touch or overlap.
 *
 * Edges are ordered by height (descending) then left end (ascending); a
 * running edge absorbs the next one when their heights differ by less than
 * \p threshold and the next starts no further than \p threshold past its
 * right end. The merged edge spans the union at the average height.
 */
std::vector<TopEdge> merge_adjacent_edges(std::vector<TopEdge> edges, float threshold);

/**
 * \brief Drop overlapping edges of nearly equal height, keeping the highest.
 *
 * Edges are visited by ascending left end. An edge whose x range strictly
 * overlaps a kept edge and whose height is within \p threshold replaces it
 * when higher and is dropped otherwise.
 */
std::vector<TopEdge> deduplicate_close_edges(std::vector<TopEdge> edges, float threshold);

}  // namespace platnav

#endif  // PLATNAV_CORE__EDGEEXTRACTOR_HPP
