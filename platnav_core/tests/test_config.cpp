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


#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include "platnav_core/PlatformGraphConfig.hpp"

using namespace platnav;

TEST(Config_Defaults, MatchDocumentedValues)
{
  PlatformGraphConfig c;
  EXPECT_FLOAT_EQ(c.scan_center.x(), 0.0f);
  EXPECT_FLOAT_EQ(c.scan_size.x(), 100.0f);
  EXPECT_FLOAT_EQ(c.scan_size.y(), 50.0f);
  EXPECT_FLOAT_EQ(c.node_spacing, 1.5f);
  EXPECT_FLOAT_EQ(c.dense_node_spacing, 0.75f);
  EXPECT_FALSE(c.use_dense_nodes);
  EXPECT_FLOAT_EQ(c.edge_inset, 0.3f);
  EXPECT_FLOAT_EQ(c.min_platform_width, 1.0f);
  EXPECT_FLOAT_EQ(c.spatial_grid_cell_size, 3.0f);
  EXPECT_EQ(c.all_platform_layers(), 0u);
  EXPECT_TRUE(c.generate_transition_nodes);
  EXPECT_NO_THROW(validate_config(c));

  EXPECT_FLOAT_EQ(c.actual_node_spacing(), 1.5f);
  c.use_dense_nodes = true;
  EXPECT_FLOAT_EQ(c.actual_node_spacing(), 0.75f);
  EXPECT_FLOAT_EQ(c.node_placement().node_spacing, 0.75f);

  c.ground_layer_mask = 1u;
  c.one_way_platform_layer_mask = 4u;
  EXPECT_EQ(c.all_platform_layers(), 5u);
}

TEST(Config_Validate, RejectsEachBadField)
{
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const std::vector<std::function<void(PlatformGraphConfig &)>> breakers = {
    [](PlatformGraphConfig & c) {c.node_spacing = 0.0f;},
    [nan](PlatformGraphConfig & c) {c.node_spacing = nan;},
    [](PlatformGraphConfig & c) {c.dense_node_spacing = -0.5f;},
    [](PlatformGraphConfig & c) {c.spatial_grid_cell_size = 0.0f;},
    [](PlatformGraphConfig & c) {c.scan_size = Vec2(0.0f, 10.0f);},
    [](PlatformGraphConfig & c) {c.scan_size = Vec2(10.0f, -1.0f);},
    [](PlatformGraphConfig & c) {c.edge_inset = -0.1f;},
    [](PlatformGraphConfig & c) {c.min_platform_width = -1.0f;},
    [](PlatformGraphConfig & c) {c.edge_inset = 0.6f;},
    [](PlatformGraphConfig & c) {c.edge_extraction.standing_height = 0.0f;},
    [](PlatformGraphConfig & c) {c.edge_extraction.ray_length = 0.0f;},
    [](PlatformGraphConfig & c) {c.edge_extraction.clearance_ratio = 0.0f;},
    [](PlatformGraphConfig & c) {c.edge_extraction.clearance_ratio = 1.5f;},
    [](PlatformGraphConfig & c) {c.walk_links.max_y_diff = 0.0f;},
    [](PlatformGraphConfig & c) {c.walk_links.max_x_gap = -1.0f;},
    [](PlatformGraphConfig & c) {c.transition.min_height = 9.0f;},
    [](PlatformGraphConfig & c) {c.transition.merge_radius = -0.1f;},
  };

  for (std::size_t i = 0; i < breakers.size(); ++i) {
    PlatformGraphConfig c;
    breakers[i](c);
    EXPECT_THROW(validate_config(c), std::invalid_argument) << "case " << i;
  }

  // Boundaries that stay valid.
  PlatformGraphConfig c;
  c.edge_inset = 0.5f;
  c.edge_extraction.clearance_ratio = 1.0f;
  c.walk_links.max_x_gap = 0.0f;
  EXPECT_NO_THROW(validate_config(c));
}

TEST(Config_Validate, MessageNamesField)
{
  PlatformGraphConfig c;
  c.spatial_grid_cell_size = -2.0f;
  try {
    validate_config(c);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument & e) {
    EXPECT_NE(std::string(e.what()).find("spatial_grid_cell_size"), std::string::npos);
  }
}

TEST(Config_Yaml, OverridesAndDefaults)
{
  const std::string text =
    "scan:\n"
    "  center: [10, -2.5]\n"
    "  size: [40, 20]\n"
    "nodes:\n"
    "  spacing: 2.0\n"
    "  use_dense: true\n"
    "spatial_grid:\n"
    "  cell_size: 4\n"
    "layers:\n"
    "  ground: 1\n"
    "  one_way_platform: 2\n"
    "  obstacle: 8\n"
    "edge_extraction:\n"
    "  max_slope: 0.7\n"
    "walk_links:\n"
    "  max_x_gap: 2.5\n"
    "transition_nodes:\n"
    "  enabled: false\n"
    "  merge_radius: 0.5\n"
    "unknown_section:\n"
    "  whatever: 1\n";

  PlatformGraphConfig c = parse_config_yaml(text);
  EXPECT_FLOAT_EQ(c.scan_center.x(), 10.0f);
  EXPECT_FLOAT_EQ(c.scan_center.y(), -2.5f);
  EXPECT_FLOAT_EQ(c.scan_size.x(), 40.0f);
  EXPECT_FLOAT_EQ(c.node_spacing, 2.0f);
  EXPECT_TRUE(c.use_dense_nodes);
  EXPECT_FLOAT_EQ(c.spatial_grid_cell_size, 4.0f);
  EXPECT_EQ(c.ground_layer_mask, 1u);
  EXPECT_EQ(c.one_way_platform_layer_mask, 2u);
  EXPECT_EQ(c.obstacle_layer_mask, 8u);
  EXPECT_FLOAT_EQ(c.edge_extraction.max_slope, 0.7f);
  EXPECT_FLOAT_EQ(c.walk_links.max_x_gap, 2.5f);
  EXPECT_FALSE(c.generate_transition_nodes);
  EXPECT_FLOAT_EQ(c.transition.merge_radius, 0.5f);

  // Untouched keys keep their defaults.
  EXPECT_FLOAT_EQ(c.dense_node_spacing, 0.75f);
  EXPECT_FLOAT_EQ(c.edge_inset, 0.3f);
  EXPECT_FLOAT_EQ(c.edge_extraction.standing_height, 1.0f);
  EXPECT_FLOAT_EQ(c.walk_links.max_y_diff, 0.5f);
  EXPECT_FLOAT_EQ(c.transition.max_height, 8.0f);
  EXPECT_NO_THROW(validate_config(c));
}

TEST(Config_Yaml, EmptyDocumentGivesDefaults)
{
  PlatformGraphConfig c = parse_config_yaml("");
  EXPECT_FLOAT_EQ(c.node_spacing, 1.5f);
  EXPECT_EQ(c.ground_layer_mask, 0u);
}

TEST(Config_Yaml, LoadingDoesNotValidate)
{
  PlatformGraphConfig c = parse_config_yaml("nodes:\n  spacing: -1\n");
  EXPECT_FLOAT_EQ(c.node_spacing, -1.0f);
  EXPECT_THROW(validate_config(c), std::invalid_argument);
}

TEST(Config_Yaml, MalformedInputThrows)
{
  EXPECT_THROW(parse_config_yaml("nodes: [1, 2"), std::runtime_error);
  EXPECT_THROW(parse_config_yaml("- 1\n- 2\n"), std::runtime_error);
  EXPECT_THROW(parse_config_yaml("nodes: 3\n"), std::runtime_error);
  EXPECT_THROW(parse_config_yaml("nodes:\n  spacing: wide\n"), std::runtime_error);
  EXPECT_THROW(parse_config_yaml("scan:\n  center: [1, 2, 3]\n"), std::runtime_error);
  EXPECT_THROW(parse_config_yaml("scan:\n  size: 5\n"), std::runtime_error);
}

TEST(Config_Yaml, LoadFromFile)
{
  namespace fs = std::filesystem;
  const fs::path path = fs::temp_directory_path() / "platnav_test_config.yaml";
  {
    std::ofstream f(path);
    f << "layers:\n  ground: 3\nnodes:\n  edge_inset: 0.2\n";
  }

  PlatformGraphConfig c = load_config_from_yaml(path.string());
  EXPECT_EQ(c.ground_layer_mask, 3u);
  EXPECT_FLOAT_EQ(c.edge_inset, 0.2f);
  fs::remove(path);

  EXPECT_THROW(
    load_config_from_yaml((fs::temp_directory_path() / "platnav_missing.yaml").string()),
    std::runtime_error);
}
