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


#include "platnav_core/PlatformGraph.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_set>
#include <utility>

#include "platnav_core/EdgeExtractor.hpp"
#include "platnav_core/Logging.hpp"
#include "platnav_core/NodePlacer.hpp"
#include "platnav_core/WalkLinkBuilder.hpp"

namespace platnav
{

const char * to_string(NodeKind kind)
{
  switch (kind) {
    case NodeKind::SURFACE: return "surface";
    case NodeKind::LEFT_EDGE: return "left_edge";
    case NodeKind::RIGHT_EDGE: return "right_edge";
    case NodeKind::ONE_WAY: return "one_way";
  }
  return "unknown";
}

const char * to_string(LinkKind kind)
{
  switch (kind) {
    case LinkKind::WALK: return "walk";
    case LinkKind::JUMP: return "jump";
    case LinkKind::FALL: return "fall";
    case LinkKind::DROP_THROUGH: return "drop_through";
  }
  return "unknown";
}

PlatformGraphGenerator::PlatformGraphGenerator(std::shared_ptr<spdlog::logger> logger)
: logger_(logger ? std::move(logger) : logging::get_logger())
{
}

// -----------------------------------------------------------------------------
// Generation
// -----------------------------------------------------------------------------

void PlatformGraphGenerator::clear()
{
  nodes_.clear();
  links_.clear();
  id_to_index_.clear();
  grid_.reset();
  next_id_ = 0;
  shapes_scanned_ = 0;
  edges_accepted_ = 0;
  transition_nodes_ = 0;
  state_ = GraphState::NOT_GENERATED;
}

void PlatformGraphGenerator::generate(
  const ShapeQueryProvider & world,
  const PlatformGraphConfig & config)
{
  validate_config(config);

  clear();
  config_ = config;
  state_ = GraphState::GENERATING;

  try {
    generate_impl_(world);
  } catch (...) {
    clear();
    throw;
  }

  state_ = GraphState::GENERATED;

  const auto s = stats();
  logger_->info(
    "platform graph generated: {} shapes, {} edges, {} nodes ({} transition), {} links, "
    "grid {} cells (max bucket {}, avg {:.2f})",
    s.shapes_scanned, s.edges_accepted, s.nodes, s.transition_nodes, s.links,
    s.grid.cells, s.grid.max_bucket, s.grid.avg_bucket);
}

void PlatformGraphGenerator::push_node_(const PlatformNode & node)
{
  id_to_index_[node.id] = nodes_.size();
  nodes_.push_back(node);
}

void PlatformGraphGenerator::generate_impl_(const ShapeQueryProvider & world)
{
  const LayerMask platform_mask = config_.all_platform_layers();
  grid_ = std::make_unique<SpatialGrid>(config_.spatial_grid_cell_size);

  if (platform_mask == 0) {
    logger_->warn("platform graph: no platform layers configured, graph is empty");
    return;
  }

  const std::vector<ShapeId> shapes =
    world.overlap_box(config_.scan_center, config_.scan_size, platform_mask);

  EdgeExtractor extractor(world, config_.edge_extraction);
  NodePlacer placer(config_.node_placement());

  std::vector<SurfaceEdge> all_edges;
  std::unordered_set<ShapeId> seen;

  for (ShapeId id : shapes) {
    if (!seen.insert(id).second) {
      continue;
    }
    ++shapes_scanned_;

    const auto info = world.shape_info(id);
    if (!info) {
      logger_->debug("shape {}: invalid handle, skipped", id);
      continue;
    }
    const bool one_way = (info->layer & config_.one_way_platform_layer_mask) != 0;

    const std::vector<TopEdge> edges = extractor.extract_shape(id, platform_mask);
    std::size_t placed = 0;
    for (const auto & e : edges) {
      all_edges.push_back(SurfaceEdge{e, id, one_way});
      const std::size_t first = nodes_.size();
      placed += placer.place(e, id, one_way, next_id_, nodes_);
      for (std::size_t i = first; i < nodes_.size(); ++i) {
        id_to_index_[nodes_[i].id] = i;
      }
    }
    edges_accepted_ += edges.size();

    logger_->debug(
      "shape {}: {} paths, {} top edges, {} nodes{}",
      id, info->path_count, edges.size(), placed, one_way ? " (one-way)" : "");
  }

  if (config_.generate_transition_nodes) {
    add_transition_nodes_(all_edges);
  }

  WalkLinkBuilder walker(config_.walk_links);
  walker.build(nodes_, links_);

  grid_->build(nodes_);
}

bool PlatformGraphGenerator::has_node_near_(const Vec2 & p, float radius) const
{
  const float r_sq = radius * radius;
  for (const auto & n : nodes_) {
    if (SpatialGrid::squared_distance(n.position.x(), n.position.y(), p) < r_sq) {
      return true;
    }
  }
  return false;
}

void PlatformGraphGenerator::add_transition_nodes_(const std::vector<SurfaceEdge> & edges)
{
  if (edges.size() < 2) {
    return;
  }

  std::vector<SurfaceEdge> by_height(edges);
  std::stable_sort(
    by_height.begin(), by_height.end(),
    [](const SurfaceEdge & a, const SurfaceEdge & b) {return a.edge.y < b.edge.y;});

  const float inset = config_.edge_inset;
  const auto & tp = config_.transition;

  auto strictly_inside = [inset](float x, const TopEdge & e) {
      return x > e.left + inset && x < e.right - inset;
    };
  auto try_add = [&](float x, const SurfaceEdge & on, NodeKind kind) {
      const Vec2 pos(x, on.edge.y);
      if (has_node_near_(pos, tp.merge_radius)) {
        return;
      }
      push_node_(PlatformNode{next_id_++, pos, kind, on.shape, on.is_one_way});
      ++transition_nodes_;
    };

  for (std::size_t i = 0; i < by_height.size(); ++i) {
    const SurfaceEdge & lower = by_height[i];
    for (std::size_t j = i + 1; j < by_height.size(); ++j) {
      const SurfaceEdge & upper = by_height[j];
      const float dh = upper.edge.y - lower.edge.y;
      if (dh > tp.max_height || dh < tp.min_height) {
        continue;
      }

      // Ends of the upper surface projected down: take-off points.
      if (strictly_inside(upper.edge.left, lower.edge)) {
        try_add(upper.edge.left, lower, NodeKind::LEFT_EDGE);
      }
      if (strictly_inside(upper.edge.right, lower.edge)) {
        try_add(upper.edge.right, lower, NodeKind::RIGHT_EDGE);
      }

      // Ends of the lower surface projected up: landing points.
      if (strictly_inside(lower.edge.left, upper.edge)) {
        try_add(lower.edge.left, upper, NodeKind::LEFT_EDGE);
      }
      if (strictly_inside(lower.edge.right, upper.edge)) {
        try_add(lower.edge.right, upper, NodeKind::RIGHT_EDGE);
      }
    }
  }

  if (transition_nodes_ > 0) {
    logger_->debug("height transitions: {} nodes added", transition_nodes_);
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

std::optional<PlatformNode> PlatformGraphGenerator::get_node(NodeId id) const
{
  auto it = id_to_index_.find(id);
  if (it == id_to_index_.end()) {
    return std::nullopt;
  }
  return nodes_[it->second];
}

std::optional<PlatformNode> PlatformGraphGenerator::find_nearest_node(
  const Vec2 & p,
  float max_distance) const
{
  if (!is_generated()) {
    return std::nullopt;
  }
  const std::optional<std::size_t> idx = grid_ ?
    grid_->find_nearest(p, max_distance) :
    find_nearest_linear(nodes_, p, max_distance);
  if (!idx) {
    return std::nullopt;
  }
  return nodes_[*idx];
}

std::optional<PlatformNode> PlatformGraphGenerator::find_nearest_node_on_shape(
  const Vec2 & p,
  ShapeId preferred_shape,
  float max_distance) const
{
  if (!is_generated()) {
    return std::nullopt;
  }

  if (preferred_shape != kInvalidShape && max_distance > 0.0f) {
    const float max_sq = max_distance * max_distance;
    const PlatformNode * best = nullptr;
    float best_sq = 0.0f;
    for (const auto & n : nodes_) {
      if (n.source_shape != preferred_shape) {
        continue;
      }
      const float d2 = SpatialGrid::squared_distance(n.position.x(), n.position.y(), p);
      if (d2 < max_sq && (best == nullptr || d2 < best_sq)) {
        best = &n;
        best_sq = d2;
      }
    }
    if (best != nullptr) {
      return *best;
    }
  }

  return find_nearest_node(p, max_distance);
}

void PlatformGraphGenerator::find_nodes_in_range(
  const Vec2 & p, float radius,
  std::vector<PlatformNode> & out) const
{
  out.clear();
  if (!is_generated()) {
    return;
  }

  if (grid_) {
    grid_->for_each_in_range(p, radius, [&](std::size_t idx) {out.push_back(nodes_[idx]);});
    std::sort(
      out.begin(), out.end(),
      [](const PlatformNode & a, const PlatformNode & b) {return a.id < b.id;});
    return;
  }

  if (!(radius >= 0.0f)) {
    return;
  }
  const float r_sq = radius * radius;
  for (const auto & n : nodes_) {
    if (SpatialGrid::squared_distance(n.position.x(), n.position.y(), p) <= r_sq) {
      out.push_back(n);
    }
  }
}

std::vector<PlatformNode> PlatformGraphGenerator::find_nodes_in_range(
  const Vec2 & p,
  float radius) const
{
  std::vector<PlatformNode> out;
  find_nodes_in_range(p, radius, out);
  return out;
}

std::vector<PlatformLink> PlatformGraphGenerator::get_outgoing_links(NodeId id) const
{
  std::vector<PlatformLink> out;
  for (const auto & l : links_) {
    if (l.from == id) {
      out.push_back(l);
    }
  }
  return out;
}

bool PlatformGraphGenerator::add_link(const PlatformLink & link)
{
  if (!(link.cost >= 0.0f)) {
    logger_->debug("add_link: rejected {} -> {}, bad cost {}", link.from, link.to, link.cost);
    return false;
  }
  if (id_to_index_.count(link.from) == 0 || id_to_index_.count(link.to) == 0) {
    logger_->debug("add_link: rejected {} -> {}, unknown node", link.from, link.to);
    return false;
  }
  links_.push_back(link);
  return true;
}

// -----------------------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------------------

PlatformGraphStats PlatformGraphGenerator::stats() const
{
  PlatformGraphStats s;
  s.shapes_scanned = shapes_scanned_;
  s.edges_accepted = edges_accepted_;
  s.transition_nodes = transition_nodes_;
  s.nodes = nodes_.size();
  s.links = links_.size();

  for (const auto & n : nodes_) {
    switch (n.kind) {
      case NodeKind::SURFACE: ++s.surface_nodes; break;
      case NodeKind::LEFT_EDGE: ++s.left_edge_nodes; break;
      case NodeKind::RIGHT_EDGE: ++s.right_edge_nodes; break;
      case NodeKind::ONE_WAY: break;
    }
    if (n.is_one_way) {
      ++s.one_way_nodes;
    }
  }
  for (const auto & l : links_) {
    switch (l.kind) {
      case LinkKind::WALK: ++s.walk_links; break;
      case LinkKind::JUMP: ++s.jump_links; break;
      case LinkKind::FALL: ++s.fall_links; break;
      case LinkKind::DROP_THROUGH: ++s.drop_through_links; break;
    }
  }
  if (grid_) {
    s.grid = grid_->stats();
  }
  return s;
}

void PlatformGraphGenerator::log_report() const
{
  const auto s = stats();
  const auto & c = config_;

  logger_->info("==== platform graph report ====");
  logger_->info(
    "config: scan center ({:.2f}, {:.2f}) size ({:.2f}, {:.2f}), spacing {:.2f}, inset {:.2f}",
    c.scan_center.x(), c.scan_center.y(), c.scan_size.x(), c.scan_size.y(),
    c.actual_node_spacing(), c.edge_inset);
  logger_->info(
    "layers: ground {:#x}, one-way {:#x}, obstacle {:#x}",
    c.ground_layer_mask, c.one_way_platform_layer_mask, c.obstacle_layer_mask);
  logger_->info(
    "nodes: {} (surface {}, left {}, right {}, one-way {}, transition {})",
    s.nodes, s.surface_nodes, s.left_edge_nodes, s.right_edge_nodes,
    s.one_way_nodes, s.transition_nodes);
  logger_->info(
    "links: {} (walk {}, jump {}, fall {}, drop-through {})",
    s.links, s.walk_links, s.jump_links, s.fall_links, s.drop_through_links);
  logger_->info(
    "grid: {} cells, {} nodes, max bucket {}, avg {:.2f}",
    s.grid.cells, s.grid.nodes, s.grid.max_bucket, s.grid.avg_bucket);

  struct Band
  {
    std::size_t count{0};
    float min_x{std::numeric_limits<float>::infinity()};
    float max_x{-std::numeric_limits<float>::infinity()};
  };
  std::map<long, Band> bands;
  for (const auto & n : nodes_) {
    Band & b = bands[std::lround(n.position.y())];
    ++b.count;
    b.min_x = std::min(b.min_x, n.position.x());
    b.max_x = std::max(b.max_x, n.position.x());
  }
  for (const auto & [y, b] : bands) {
    logger_->info("  y={}: {} nodes, x in [{:.1f}, {:.1f}]", y, b.count, b.min_x, b.max_x);
  }
}

}  // namespace platnav
