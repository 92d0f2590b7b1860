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

#ifndef PLATNAV_CORE__PLATFORMGRAPH_HPP
#define PLATNAV_CORE__PLATFORMGRAPH_HPP

/**
 * \file
 * \brief Platform graph generator: turns static 2D shapes into a walkable
 *        node/link graph with a spatial index for point queries.
 *
 * Generation pipeline (one synchronous call):
 *  1. Collect the shapes overlapping the scan region on the platform layers.
 *  2. Extract walkable top edges per shape (::platnav::EdgeExtractor).
 *  3. Place nodes along each edge (::platnav::NodePlacer).
 *  4. Add height transition nodes where surfaces overlap vertically.
 *  5. Link neighbouring nodes of a surface (::platnav::WalkLinkBuilder).
 *  6. Index node positions (::platnav::SpatialGrid).
 *
 * Movement solvers add JUMP / FALL / DROP_THROUGH links afterwards through
 * ::platnav::PlatformGraphGenerator::add_link().
 */

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "platnav_core/Geometry.hpp"
#include "platnav_core/PlatformGraphConfig.hpp"
#include "platnav_core/PlatformTypes.hpp"
#include "platnav_core/ShapeQuery.hpp"
#include "platnav_core/SpatialGrid.hpp"

namespace platnav
{

/// \brief Lifecycle of a generator.
enum class GraphState : uint8_t { NOT_GENERATED = 0, GENERATING = 1, GENERATED = 2 };

/**
 * \brief Counters describing the current graph.
 */
struct PlatformGraphStats
{
  std::size_t shapes_scanned{0};     ///< Shapes returned by the scan
  std::size_t edges_accepted{0};     ///< Top edges after merge / dedup
  std::size_t nodes{0};
  std::size_t surface_nodes{0};
  std::size_t left_edge_nodes{0};
  std::size_t right_edge_nodes{0};
  std::size_t one_way_nodes{0};      ///< Nodes with is_one_way set
  std::size_t transition_nodes{0};   ///< Nodes added by the height transition pass
  std::size_t links{0};
  std::size_t walk_links{0};
  std::size_t jump_links{0};
  std::size_t fall_links{0};
  std::size_t drop_through_links{0};
  SpatialGridStats grid;             ///< Index occupancy (zeros if not built)
};

/**
 * \brief Owns one platform graph and answers queries on it.
 *
 * Not thread-safe for writers: generate(), clear() and add_link() must not
 * run concurrently with anything else. Const queries may run concurrently
 * with each other.
 */
class PlatformGraphGenerator {
public:
  /**
   * \param logger Destination for diagnostics; nullptr selects
   *               ::platnav::logging::get_logger().
   */
  explicit PlatformGraphGenerator(std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * \brief Build the graph from scratch.
   *
   * The configuration is validated before any state is touched. If the
   * provider throws, the graph is left cleared and the exception propagates.
   *
   * \param world  Shape source; only used during this call.
   * \param config Generation parameters (copied).
   * \throws std::invalid_argument if \p config is invalid.
   */
  void generate(const ShapeQueryProvider & world, const PlatformGraphConfig & config);

  /// \brief Discard nodes, links and the index; reset the id counter.
  void clear();

  inline GraphState state() const {return state_;}
  inline bool is_generated() const {return state_ == GraphState::GENERATED;}

  /// \brief Nodes in creation order (index == id).
  inline const std::vector<PlatformNode> & nodes() const {return nodes_;}
  /// \brief Links in creation order.
  inline const std::vector<PlatformLink> & links() const {return links_;}
  /// \brief Configuration of the last generate() call.
  inline const PlatformGraphConfig & config() const {return config_;}
  /// \brief Spatial index, or nullptr if not built.
  inline const SpatialGrid * spatial_grid() const {return grid_.get();}

  /// \return The node with \p id, or std::nullopt.
  std::optional<PlatformNode> get_node(NodeId id) const;

  /**
   * \brief Node closest to \p p, strictly closer than \p max_distance.
   *
   * Equal distances resolve to the lower id.
   */
  std::optional<PlatformNode> find_nearest_node(
    const Vec2 & p,
    float max_distance = std::numeric_limits<float>::infinity()) const;

  /**
   * \brief Nearest node on \p preferred_shape, falling back to any shape.
   *
   * Useful when the caller knows which surface an agent stands on and
   * another surface's node happens to be slightly closer.
   */
  std::optional<PlatformNode> find_nearest_node_on_shape(
    const Vec2 & p,
    ShapeId preferred_shape,
    float max_distance = std::numeric_limits<float>::infinity()) const;

  /// \brief Every node within \p radius of \p p, in id order.
  std::vector<PlatformNode> find_nodes_in_range(const Vec2 & p, float radius) const;

  /**
   * \brief Same as find_nodes_in_range(p, radius), filling a caller buffer.
   *
   * \p out is cleared first. With enough capacity the call does not allocate.
   */
  void find_nodes_in_range(const Vec2 & p, float radius, std::vector<PlatformNode> & out) const;

  /// \return Links whose source is \p id, in creation order.
  std::vector<PlatformLink> get_outgoing_links(NodeId id) const;

  /**
   * \brief Append a consumer link (typically JUMP, FALL or DROP_THROUGH).
   * \return false if either end does not exist or the cost is negative / NaN.
   */
  bool add_link(const PlatformLink & link);

  /// \return Counters for the current graph.
  PlatformGraphStats stats() const;

  /**
   * \brief Write a human-readable report of the graph to the logger (info).
   *
   * Lists the configuration summary, node and link counts, index occupancy,
   * and the node distribution per integer height.
   */
  void log_report() const;

private:
  /// \brief Accepted edge plus the surface it belongs to.
  struct SurfaceEdge
  {
    TopEdge edge;
    ShapeId shape;
    bool is_one_way;
  };

  void generate_impl_(const ShapeQueryProvider & world);
  void add_transition_nodes_(const std::vector<SurfaceEdge> & edges);
  bool has_node_near_(const Vec2 & p, float radius) const;
  void push_node_(const PlatformNode & node);

  std::shared_ptr<spdlog::logger> logger_;
  PlatformGraphConfig config_;
  GraphState state_{GraphState::NOT_GENERATED};

  std::vector<PlatformNode> nodes_;
  std::vector<PlatformLink> links_;
  std::unordered_map<NodeId, std::size_t> id_to_index_;
  std::unique_ptr<SpatialGrid> grid_;
  NodeId next_id_{0};

  std::size_t shapes_scanned_{0};
  std::size_t edges_accepted_{0};
  std::size_t transition_nodes_{0};
};

}  // namespace platnav

#endif  // PLATNAV_CORE__PLATFORMGRAPH_HPP
