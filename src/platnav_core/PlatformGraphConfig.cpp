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


#include "platnav_core/PlatformGraphConfig.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace platnav
{

/** @cond INTERNAL */
namespace
{

void require(bool ok, const std::string & field, const std::string & rule)
{
  if (!ok) {
    throw std::invalid_argument("PlatformGraphConfig: " + field + " " + rule);
  }
}

template<typename T>
void read(const YAML::Node & parent, const char * key, const std::string & section, T & dst)
{
  const YAML::Node n = parent[key];
  if (!n || n.IsNull()) {
    return;
  }
  try {
    dst = n.as<T>();
  } catch (const YAML::Exception & e) {
    throw std::runtime_error(
            "platnav config: bad value for '" + section + "." + key + "': " + e.what());
  }
}

void read_vec2(
  const YAML::Node & parent, const char * key, const std::string & section,
  Vec2 & dst)
{
  const YAML::Node n = parent[key];
  if (!n || n.IsNull()) {
    return;
  }
  if (!n.IsSequence() || n.size() != 2) {
    throw std::runtime_error(
            "platnav config: '" + section + "." + key + "' must be a [x, y] pair");
  }
  try {
    dst = Vec2(n[0].as<float>(), n[1].as<float>());
  } catch (const YAML::Exception & e) {
    throw std::runtime_error(
            "platnav config: bad value for '" + section + "." + key + "': " + e.what());
  }
}

// Returns an undefined node when the section is absent.
YAML::Node section(const YAML::Node & root, const char * name)
{
  YAML::Node s = root[name];
  if (s && !s.IsNull() && !s.IsMap()) {
    throw std::runtime_error(std::string("platnav config: section '") + name + "' must be a map");
  }
  return s;
}

PlatformGraphConfig from_yaml(const YAML::Node & root)
{
  PlatformGraphConfig cfg;
  if (!root || root.IsNull()) {
    return cfg;
  }
  if (!root.IsMap()) {
    throw std::runtime_error("platnav config: top level must be a map");
  }

  if (auto s = section(root, "scan"); s && s.IsMap()) {
    read_vec2(s, "center", "scan", cfg.scan_center);
    read_vec2(s, "size", "scan", cfg.scan_size);
  }
  if (auto s = section(root, "nodes"); s && s.IsMap()) {
    read(s, "spacing", "nodes", cfg.node_spacing);
    read(s, "dense_spacing", "nodes", cfg.dense_node_spacing);
    read(s, "use_dense", "nodes", cfg.use_dense_nodes);
    read(s, "edge_inset", "nodes", cfg.edge_inset);
    read(s, "min_platform_width", "nodes", cfg.min_platform_width);
  }
  if (auto s = section(root, "spatial_grid"); s && s.IsMap()) {
    read(s, "cell_size", "spatial_grid", cfg.spatial_grid_cell_size);
  }
  if (auto s = section(root, "layers"); s && s.IsMap()) {
    read(s, "ground", "layers", cfg.ground_layer_mask);
    read(s, "one_way_platform", "layers", cfg.one_way_platform_layer_mask);
    read(s, "obstacle", "layers", cfg.obstacle_layer_mask);
  }
  if (auto s = section(root, "edge_extraction"); s && s.IsMap()) {
    auto & e = cfg.edge_extraction;
    read(s, "min_edge_span", "edge_extraction", e.min_edge_span);
    read(s, "max_slope", "edge_extraction", e.max_slope);
    read(s, "standing_height", "edge_extraction", e.standing_height);
    read(s, "ray_length", "edge_extraction", e.ray_length);
    read(s, "surface_tolerance", "edge_extraction", e.surface_tolerance);
    read(s, "clearance_ratio", "edge_extraction", e.clearance_ratio);
    read(s, "merge_threshold", "edge_extraction", e.merge_threshold);
    read(s, "dedup_threshold", "edge_extraction", e.dedup_threshold);
  }
  if (auto s = section(root, "walk_links"); s && s.IsMap()) {
    read(s, "max_x_gap", "walk_links", cfg.walk_links.max_x_gap);
    read(s, "max_y_diff", "walk_links", cfg.walk_links.max_y_diff);
  }
  if (auto s = section(root, "transition_nodes"); s && s.IsMap()) {
    read(s, "enabled", "transition_nodes", cfg.generate_transition_nodes);
    read(s, "min_height", "transition_nodes", cfg.transition.min_height);
    read(s, "max_height", "transition_nodes", cfg.transition.max_height);
    read(s, "merge_radius", "transition_nodes", cfg.transition.merge_radius);
  }
  return cfg;
}

}  // namespace
/** @endcond */

void validate_config(const PlatformGraphConfig & c)
{
  require(c.node_spacing > 0.0f, "node_spacing", "must be > 0");
  require(c.dense_node_spacing > 0.0f, "dense_node_spacing", "must be > 0");
  require(c.spatial_grid_cell_size > 0.0f, "spatial_grid_cell_size", "must be > 0");
  require(c.scan_size.x() > 0.0f && c.scan_size.y() > 0.0f, "scan_size", "must be > 0 on both axes");
  require(c.edge_inset >= 0.0f, "edge_inset", "must be >= 0");
  require(c.min_platform_width >= 0.0f, "min_platform_width", "must be >= 0");
  require(
    2.0f * c.edge_inset <= c.min_platform_width, "edge_inset",
    "must be at most half of min_platform_width");

  const auto & e = c.edge_extraction;
  require(e.standing_height > 0.0f, "edge_extraction.standing_height", "must be > 0");
  require(e.ray_length > 0.0f, "edge_extraction.ray_length", "must be > 0");
  require(
    e.clearance_ratio > 0.0f && e.clearance_ratio <= 1.0f,
    "edge_extraction.clearance_ratio", "must be in (0, 1]");

  require(c.walk_links.max_x_gap >= 0.0f, "walk_links.max_x_gap", "must be >= 0");
  require(c.walk_links.max_y_diff > 0.0f, "walk_links.max_y_diff", "must be > 0");

  require(
    c.transition.min_height <= c.transition.max_height, "transition.min_height",
    "must not exceed transition.max_height");
  require(c.transition.merge_radius >= 0.0f, "transition.merge_radius", "must be >= 0");
}

PlatformGraphConfig parse_config_yaml(const std::string & text)
{
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception & e) {
    throw std::runtime_error(std::string("platnav config: cannot parse YAML: ") + e.what());
  }
  return from_yaml(root);
}

PlatformGraphConfig load_config_from_yaml(const std::string & path)
{
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception & e) {
    throw std::runtime_error("platnav config: cannot load '" + path + "': " + e.what());
  }
  try {
    return from_yaml(root);
  } catch (const std::runtime_error & e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

}  // namespace platnav
