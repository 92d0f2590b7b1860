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

#ifndef PLATNAV_CORE__PLATFORMGRAPHCONFIG_HPP
#define PLATNAV_CORE__PLATFORMGRAPHCONFIG_HPP

/**
 * \file
 * \brief Generation parameters, validation and YAML loading.
 */

#include <string>

#include "platnav_core/EdgeExtractor.hpp"
#include "platnav_core/Geometry.hpp"
#include "platnav_core/NodePlacer.hpp"
#include "platnav_core/ShapeQuery.hpp"
#include "platnav_core/WalkLinkBuilder.hpp"

namespace platnav
{

/// \brief Height transition node thresholds.
struct TransitionNodeParams
{
  float min_height{0.5f};    ///< Smallest height difference treated as a transition
  float max_height{8.0f};    ///< Largest height difference treated as a transition
  float merge_radius{0.3f};  ///< Candidates this close to an existing node are skipped
};

/**
 * \brief Everything ::platnav::PlatformGraphGenerator::generate() needs besides the world.
 *
 * Layer masks are 32-bit; a shape is a platform when its layer intersects
 * ground_layer_mask | one_way_platform_layer_mask, and one-way when it
 * intersects one_way_platform_layer_mask.
 */
struct PlatformGraphConfig
{
  // Scan region
  Vec2 scan_center{0.0f, 0.0f};
  Vec2 scan_size{100.0f, 50.0f};

  // Node placement
  float node_spacing{1.5f};
  float dense_node_spacing{0.75f};
  bool use_dense_nodes{false};
  float edge_inset{0.3f};
  float min_platform_width{1.0f};

  // Spatial index
  float spatial_grid_cell_size{3.0f};

  // Layers
  LayerMask ground_layer_mask{0};
  LayerMask one_way_platform_layer_mask{0};
  LayerMask obstacle_layer_mask{0};  ///< Not used by generation; carried for movement solvers

  EdgeExtractionParams edge_extraction;
  WalkLinkParams walk_links;

  bool generate_transition_nodes{true};
  TransitionNodeParams transition;

  /// \return ground_layer_mask | one_way_platform_layer_mask.
  inline LayerMask all_platform_layers() const
  {
    return ground_layer_mask | one_way_platform_layer_mask;
  }

  /// \return dense_node_spacing when use_dense_nodes is set, node_spacing otherwise.
  inline float actual_node_spacing() const
  {
    return use_dense_nodes ? dense_node_spacing : node_spacing;
  }

  /// \return Placement parameters derived from this configuration.
  inline NodePlacementParams node_placement() const
  {
    return NodePlacementParams{actual_node_spacing(), edge_inset, min_platform_width};
  }
};

/**
 * \brief Check a configuration for values generation cannot work with.
 * \throws std::invalid_argument naming the first offending field.
 */
void validate_config(const PlatformGraphConfig & config);

/**
 * \brief Parse a configuration from YAML text.
 *
 * Missing keys keep their defaults and unknown keys are ignored. The result
 * is not validated; ::platnav::validate_config() does that.
 *
 * \throws std::runtime_error on malformed YAML or a value of the wrong type.
 */
PlatformGraphConfig parse_config_yaml(const std::string & text);

/**
 * \brief Load a configuration from a YAML file.
 * \throws std::runtime_error if the file cannot be read or parsed.
 */
PlatformGraphConfig load_config_from_yaml(const std::string & path);

}  // namespace platnav

#endif  // PLATNAV_CORE__PLATFORMGRAPHCONFIG_HPP
