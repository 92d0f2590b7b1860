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


#include <exception>
#include <iostream>
#include <string>
#include <Eigen/Core>

#include "platnav_core/PlatformGraph.hpp"
#include "platnav_core/PlatformGraphConfig.hpp"
#include "platnav_core/StaticWorld.hpp"

using platnav::PlatformGraphConfig;
using platnav::PlatformGraphGenerator;
using platnav::StaticWorld;
using platnav::Vec2;
using std::cout; using std::cerr; using std::endl;

// 03_yaml_config: load parameters from YAML (default config/platform_graph.yaml)
int main(int argc, char ** argv)
{
  const std::string path = argc > 1 ? argv[1] : "config/platform_graph.yaml";

  PlatformGraphConfig cfg;
  try {
    cfg = platnav::load_config_from_yaml(path);
    platnav::validate_config(cfg);
  } catch (const std::exception & e) {
    cerr << "cannot use " << path << ": " << e.what() << endl;
    return 1;
  }

  StaticWorld world;
  world.add_box(Vec2(0.0f, -0.5f), Vec2(40.0f, 1.0f), cfg.ground_layer_mask);
  world.add_box(Vec2(-6.0f, 2.25f), Vec2(5.0f, 0.5f), cfg.ground_layer_mask);
  world.add_polyline({Vec2(4.0f, 4.0f), Vec2(9.0f, 4.0f)}, cfg.one_way_platform_layer_mask);

  PlatformGraphGenerator gen;
  gen.generate(world, cfg);

  const auto s = gen.stats();
  cout << "nodes=" << s.nodes << " links=" << s.links << " one_way=" << s.one_way_nodes <<
    " grid_cells=" << s.grid.cells << endl;
  return 0;
}
