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


#include <iostream>
#include <vector>
#include <Eigen/Core>

#include "platnav_core/PlatformGraph.hpp"
#include "platnav_core/StaticWorld.hpp"

using platnav::PlatformGraphConfig;
using platnav::PlatformGraphGenerator;
using platnav::StaticWorld;
using platnav::Vec2;
using std::cout; using std::endl;

// 01_single_platform: one wide floor, nodes, walk links, nearest query
int main()
{
  StaticWorld world;
  world.add_box(Vec2(5.0f, -0.5f), Vec2(10.0f, 1.0f), 1u);

  PlatformGraphConfig cfg;
  cfg.ground_layer_mask = 1u;

  PlatformGraphGenerator gen;
  gen.generate(world, cfg);

  for (const auto & n : gen.nodes()) {
    cout << "node " << n.id << " " << platnav::to_string(n.kind) <<
      " x=" << n.position.x() << " y=" << n.position.y() << endl;
  }
  cout << "links=" << gen.links().size() << endl;

  auto nearest = gen.find_nearest_node(Vec2(3.0f, 0.4f));
  if (nearest) {
    cout << "nearest to (3, 0.4): " << nearest->id << " x=" << nearest->position.x() << endl;
    for (const auto & l : gen.get_outgoing_links(nearest->id)) {
      cout << "  -> " << l.to << " cost=" << l.cost << endl;
    }
  }
  return 0;
}
