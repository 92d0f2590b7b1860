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
#include <stdexcept>
#include <vector>
#include "platnav_core/StaticWorld.hpp"

using namespace platnav;

static constexpr LayerMask kGround = 1u << 0;
static constexpr LayerMask kOneWay = 1u << 1;

TEST(StaticWorld_Shapes, IdsInfoAndPaths)
{
  StaticWorld world;
  ShapeId box = world.add_box(Vec2(5.0f, -0.5f), Vec2(10.0f, 1.0f), kGround);
  ShapeId line = world.add_polyline({Vec2(0, 3), Vec2(2, 3), Vec2(4, 4)}, kOneWay);
  ShapeId poly = world.add_polygon(
    {{Vec2(0, 0), Vec2(1, 0), Vec2(1, 1)}, {Vec2(5, 0), Vec2(6, 0), Vec2(6, 1)}}, kGround);

  EXPECT_EQ(box, 0u);
  EXPECT_EQ(line, 1u);
  EXPECT_EQ(poly, 2u);
  EXPECT_EQ(world.size(), 3u);

  auto info = world.shape_info(box);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->kind, ShapeKind::BOX);
  EXPECT_EQ(info->layer, kGround);
  EXPECT_EQ(info->path_count, 1u);

  // Box corners, counter-clockwise from the bottom-left one.
  std::vector<Vec2> path;
  ASSERT_TRUE(world.shape_path(box, 0, path));
  ASSERT_EQ(path.size(), 4u);
  EXPECT_FLOAT_EQ(path[0].x(), 0.0f);
  EXPECT_FLOAT_EQ(path[0].y(), -1.0f);
  EXPECT_FLOAT_EQ(path[2].x(), 10.0f);
  EXPECT_FLOAT_EQ(path[2].y(), 0.0f);

  EXPECT_EQ(world.shape_info(line)->kind, ShapeKind::POLYLINE);
  EXPECT_EQ(world.shape_info(poly)->path_count, 2u);

  // Invalid path index and unknown ids.
  EXPECT_FALSE(world.shape_path(box, 1, path));
  EXPECT_TRUE(path.empty());
  EXPECT_FALSE(world.shape_info(42).has_value());
  EXPECT_FALSE(world.shape_path(42, 0, path));
}

TEST(StaticWorld_Shapes, RejectsDegenerateInput)
{
  StaticWorld world;
  EXPECT_THROW(world.add_polyline({Vec2(0, 0)}, kGround), std::invalid_argument);
  EXPECT_THROW(world.add_polygon({}, kGround), std::invalid_argument);
  EXPECT_THROW(world.add_polygon({{Vec2(0, 0), Vec2(1, 0)}}, kGround), std::invalid_argument);
  EXPECT_EQ(world.size(), 0u);
}

TEST(StaticWorld_Overlap, MaskExactTestAndOrder)
{
  StaticWorld world;
  world.add_box(Vec2(0, 0), Vec2(2, 2), kGround);                   // 0
  world.add_box(Vec2(10, 0), Vec2(2, 2), kOneWay);                  // 1
  world.add_polyline({Vec2(-5, 5), Vec2(5, -5)}, kGround);          // 2: diagonal
  world.add_polygon({{Vec2(20, 0), Vec2(30, 0), Vec2(25, 10)}}, kGround);  // 3

  auto all = world.overlap_box(Vec2(0, 0), Vec2(100, 100), kGround | kOneWay);
  ASSERT_EQ(all.size(), 4u);
  for (std::size_t i = 0; i < all.size(); ++i) {
    EXPECT_EQ(all[i], static_cast<ShapeId>(i));
  }

  auto ground = world.overlap_box(Vec2(0, 0), Vec2(100, 100), kGround);
  EXPECT_EQ(ground, (std::vector<ShapeId>{0, 2, 3}));

  // The diagonal's bounding box covers (4, 4) but the segment does not.
  auto corner = world.overlap_box(Vec2(4, 4), Vec2(1, 1), kGround);
  EXPECT_TRUE(corner.empty());

  // Query box entirely inside the triangle.
  auto inside = world.overlap_box(Vec2(25, 3), Vec2(0.5f, 0.5f), kGround);
  EXPECT_EQ(inside, (std::vector<ShapeId>{3}));
}

TEST(StaticWorld_Raycast, ClosestHitAndMask)
{
  StaticWorld world;
  world.add_box(Vec2(0, -0.5f), Vec2(4, 1), kGround);     // top at y = 0
  world.add_box(Vec2(0, 2.25f), Vec2(2, 0.5f), kOneWay);  // top at 2.5, bottom at 2

  auto hit = world.raycast(Vec2(0, 5), Vec2(0, -1), 10.0f, kGround | kOneWay);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->shape, 1u);
  EXPECT_NEAR(hit->point.y(), 2.5f, 1e-5f);
  EXPECT_NEAR(hit->distance, 2.5f, 1e-5f);

  // The one-way layer filtered out: the ground top is hit.
  hit = world.raycast(Vec2(0, 5), Vec2(0, -1), 10.0f, kGround);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->shape, 0u);
  EXPECT_NEAR(hit->point.y(), 0.0f, 1e-5f);

  // Direction does not need to be normalized.
  hit = world.raycast(Vec2(0, 5), Vec2(0, -7), 10.0f, kGround);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->distance, 5.0f, 1e-5f);

  // Too short, zero direction, empty mask.
  EXPECT_FALSE(world.raycast(Vec2(0, 5), Vec2(0, -1), 2.0f, kGround | kOneWay).has_value());
  EXPECT_FALSE(world.raycast(Vec2(0, 5), Vec2(0, 0), 10.0f, kGround).has_value());
  EXPECT_FALSE(world.raycast(Vec2(0, 5), Vec2(0, -1), 10.0f, 0u).has_value());
}

TEST(StaticWorld_Raycast, StartInsideShape)
{
  StaticWorld world;
  world.add_box(Vec2(0, 0), Vec2(2, 2), kGround);

  auto hit = world.raycast(Vec2(0, 0), Vec2(0, -1), 5.0f, kGround);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->shape, 0u);
  EXPECT_FLOAT_EQ(hit->distance, 0.0f);
  EXPECT_FLOAT_EQ(hit->point.y(), 0.0f);

  // Disabled: the ray leaves the box through its bottom side.
  world.set_queries_start_in_shapes(false);
  hit = world.raycast(Vec2(0, 0), Vec2(0, -1), 5.0f, kGround);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->point.y(), -1.0f, 1e-5f);
}

TEST(StaticWorld_Raycast, PolylineIsOpen)
{
  StaticWorld world;
  // U-shaped open chain; the missing top side must not block rays.
  world.add_polyline({Vec2(0, 2), Vec2(0, 0), Vec2(4, 0), Vec2(4, 2)}, kGround);

  auto hit = world.raycast(Vec2(2, 5), Vec2(0, -1), 10.0f, kGround);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->point.y(), 0.0f, 1e-5f);

  // Origins "inside" an open chain are not treated as inside a solid.
  hit = world.raycast(Vec2(2, 1), Vec2(0, -1), 10.0f, kGround);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->distance, 1.0f, 1e-5f);
}

TEST(StaticWorld_Enable, DisabledShapesAreInvisible)
{
  StaticWorld world;
  ShapeId id = world.add_box(Vec2(0, -0.5f), Vec2(4, 1), kGround);
  ASSERT_TRUE(world.raycast(Vec2(0, 5), Vec2(0, -1), 10.0f, kGround).has_value());

  ASSERT_TRUE(world.set_enabled(id, false));
  EXPECT_FALSE(world.is_enabled(id));
  EXPECT_FALSE(world.raycast(Vec2(0, 5), Vec2(0, -1), 10.0f, kGround).has_value());
  EXPECT_TRUE(world.overlap_box(Vec2(0, 0), Vec2(10, 10), kGround).empty());
  EXPECT_FALSE(world.shape_info(id).has_value());

  ASSERT_TRUE(world.set_enabled(id, true));
  EXPECT_TRUE(world.raycast(Vec2(0, 5), Vec2(0, -1), 10.0f, kGround).has_value());

  EXPECT_FALSE(world.set_enabled(99, false));
}

TEST(StaticWorld_Raycast, ManySegmentsMatchBruteForce)
{
  // Enough shapes to force several BVH levels.
  StaticWorld world;
  for (int i = 0; i < 40; ++i) {
    const float x = static_cast<float>(i) * 1.5f;
    const float top = static_cast<float>(i % 5);
    world.add_box(Vec2(x, top - 0.25f), Vec2(1.0f, 0.5f), kGround);
  }

  for (int i = 0; i < 40; ++i) {
    const float x = static_cast<float>(i) * 1.5f;
    auto hit = world.raycast(Vec2(x, 10.0f), Vec2(0, -1), 20.0f, kGround);
    ASSERT_TRUE(hit.has_value()) << "column " << i;
    EXPECT_EQ(hit->shape, static_cast<ShapeId>(i));
    EXPECT_NEAR(hit->point.y(), static_cast<float>(i % 5), 1e-4f);
  }

  // Gaps between boxes.
  EXPECT_FALSE(world.raycast(Vec2(0.75f, 10.0f), Vec2(0, -1), 20.0f, kGround).has_value());
}
