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

using platnav::LinkKind;
using platnav::NodeKind;
using platnav::PlatformGraphConfig;
using platnav::PlatformGraphGenerator;
using platnav::PlatformLink;
using platnav::StaticWorld;
using platnav::Vec2;
using std::cout; using std::endl;

// 02_two_floors: ledge above a floor, transition nodes, consumer jump links
int main()
{
  const platnav::LayerMask ground = 1u << 0;
  const platnav::LayerMask one_way = 1u << 1;

  StaticWorld world;
  world.add_box(Vec2(5.0f, -0.5f), Vec2(10.0f, 1.0f), ground);
  world.add_box(Vec2(5.0f, 1.75f), Vec2(2.0f, 0.5f), ground);
  world.add_polyline({Vec2(12.0f, 3.0f), Vec2(16.0f, 3.0f)}, one_way);

  PlatformGraphConfig cfg;
  cfg.ground_layer_mask = ground;
  cfg.one_way_platform_layer_mask = one_way;

  PlatformGraphGenerator gen;
  gen.generate(world, cfg);

  // Transition nodes on the floor get a jump to the nearest ledge node.
  const auto transitions = gen.stats().transition_nodes;
  const auto & nodes = gen.nodes();
  for (std::size_t i = nodes.size() - transitions; i < nodes.size(); ++i) {
    const auto & from = nodes[i];
    auto target = gen.find_nearest_node(from.position + Vec2(0.0f, 2.0f), 1.0f);
    if (!target || target->source_shape == from.source_shape) {
      continue;
    }
    const float cost = (target->position - from.position).norm() * 2.0f;
    const bool ok = gen.add_link(PlatformLink{from.id, target->id, LinkKind::JUMP, cost});
    cout << "jump " << from.id << " -> " << target->id << " ok=" << ok << endl;
  }

  auto under_ledge = gen.find_nodes_in_range(Vec2(5.0f, 0.0f), 1.2f);
  cout << "nodes under ledge:";
  for (const auto & n : under_ledge) {
    cout << " " << n.id << (n.kind == NodeKind::SURFACE ? "" : "*");
  }
  cout << endl;

  gen.log_report();
  return 0;
}
