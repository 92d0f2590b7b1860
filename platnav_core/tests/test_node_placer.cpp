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
#include <vector>
#include "platnav_core/NodePlacer.hpp"

using namespace platnav;

static constexpr float kEps = 1e-4f;

TEST(NodePlacer_Place, WidePlatformEdgesThenInterior)
{
  NodePlacer placer;  // spacing 1.5, inset 0.3, min width 1
  std::vector<PlatformNode> out;
  NodeId next = 0;

  const std::size_t n = placer.place(TopEdge{0.0f, 10.0f, 0.0f}, 7u, false, next, out);
  ASSERT_EQ(n, 8u);
  ASSERT_EQ(out.size(), 8u);
  EXPECT_EQ(next, 8u);

  EXPECT_EQ(out[0].kind, NodeKind::LEFT_EDGE);
  EXPECT_NEAR(out[0].position.x(), 0.3f, kEps);
  EXPECT_EQ(out[1].kind, NodeKind::RIGHT_EDGE);
  EXPECT_NEAR(out[1].position.x(), 9.7f, kEps);

  // 9.4 / 1.5 -> 6 interior nodes at a step of 9.4 / 7.
  const float step = 9.4f / 7.0f;
  for (int i = 0; i < 6; ++i) {
    const auto & node = out[2 + i];
    EXPECT_EQ(node.kind, NodeKind::SURFACE);
    EXPECT_NEAR(node.position.x(), 0.3f + step * static_cast<float>(i + 1), kEps);
  }

  for (std::size_t i = 0; i < out.size(); ++i) {
    EXPECT_EQ(out[i].id, static_cast<NodeId>(i));
    EXPECT_EQ(out[i].source_shape, 7u);
    EXPECT_FALSE(out[i].is_one_way);
    EXPECT_FLOAT_EQ(out[i].position.y(), 0.0f);
  }
}

TEST(NodePlacer_Place, NarrowPlatformSingleCenterNode)
{
  NodePlacer placer;
  std::vector<PlatformNode> out;
  NodeId next = 3;

  ASSERT_EQ(placer.place(TopEdge{0.0f, 0.8f, 1.5f}, 1u, true, next, out), 1u);
  EXPECT_EQ(out[0].id, 3u);
  EXPECT_EQ(next, 4u);
  EXPECT_EQ(out[0].kind, NodeKind::SURFACE);
  EXPECT_NEAR(out[0].position.x(), 0.4f, kEps);
  EXPECT_NEAR(out[0].position.y(), 1.5f, kEps);
  EXPECT_TRUE(out[0].is_one_way);
}

TEST(NodePlacer_Place, MinimumWidthHasOnlyEdgeNodes)
{
  NodePlacer placer;
  std::vector<PlatformNode> out;
  NodeId next = 0;

  // Exactly min width: not narrow; inner 0.4 fits no interior node.
  ASSERT_EQ(placer.place(TopEdge{2.0f, 3.0f, 0.0f}, 0u, false, next, out), 2u);
  EXPECT_NEAR(out[0].position.x(), 2.3f, kEps);
  EXPECT_NEAR(out[1].position.x(), 2.7f, kEps);
}

TEST(NodePlacer_Place, DenseSpacingAddsNodes)
{
  NodePlacementParams dense;
  dense.node_spacing = 0.75f;
  NodePlacer placer(dense);
  std::vector<PlatformNode> out;
  NodeId next = 0;

  // 9.4 / 0.75 -> 12 interior nodes.
  EXPECT_EQ(placer.place(TopEdge{0.0f, 10.0f, 0.0f}, 0u, false, next, out), 14u);
}

TEST(NodePlacer_Place, AppendsAfterExistingNodes)
{
  NodePlacer placer;
  std::vector<PlatformNode> out;
  NodeId next = 0;

  placer.place(TopEdge{0.0f, 0.5f, 0.0f}, 0u, false, next, out);
  placer.place(TopEdge{5.0f, 5.6f, 2.0f}, 1u, false, next, out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1].id, 1u);
  EXPECT_EQ(out[1].source_shape, 1u);
}
