#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "internal/graph/adjacency_view.hpp"
#include "kinship/graph/v1.hpp"

namespace kinship::graph {

using DepthMode = kinship::graph::v1::DepthMode;

// Decides whether a reachable person is reported. Never affects reachability.
using KeepFn = std::function<bool(const std::string& person_id)>;

struct DiscoveredPerson {
  std::string   person_id;
  std::uint32_t depth = 0;

  // The person this one was first reached from, and the edge between them.
  std::string             parent_id;
  model::RelationshipKind kind         = kinship::graph::v1::RELATIONSHIP_KIND_UNSPECIFIED; // to parent
  model::RelationshipKind reverse_kind = kinship::graph::v1::RELATIONSHIP_KIND_UNSPECIFIED; // parent to this
};

struct DiscoveryResult {
  std::uint32_t requested_depth = 0;
  std::uint32_t effective_depth = 0;
  bool          depth_clamped   = false;

  DepthMode depth_mode = kinship::graph::v1::DEPTH_MODE_UP_TO;

  // Persons reached by the traversal, root included.
  std::size_t visited_count = 0;

  // Survivors in discovery order, each at its minimal depth.
  std::vector<DiscoveredPerson> relatives;
};

/*
  Depth validation shared by the engine and the services that size their
  edge loads before a view exists.

  Throws util::InvalidArgument for depth 0. Depths above the ceiling are
  clamped, not rejected.
*/
std::uint32_t EffectiveDepth(std::uint32_t requested_depth, std::uint32_t ceiling);

// UNSPECIFIED means UP_TO. Throws util::InvalidDepthMode for anything else.
DepthMode NormalizeDepthMode(DepthMode mode);

/*
  Bounded breadth-first discovery from root_id.

  Nodes are marked on first discovery, so each person carries its minimal
  depth and the neighbor entry it was reached through; cycles terminate. Nodes at the depth limit are not expanded.
  Afterwards the root is dropped, the depth mode selects the survivors
  (UP_TO: 1..depth, ONLY_AT: exactly depth) and keep() runs on those only.

  Throws util::PersonNotFound when the root is not in the view.
*/
DiscoveryResult Discover(const AdjacencyView& view,
                         const std::string&   root_id,
                         std::uint32_t        max_depth,
                         DepthMode            depth_mode,
                         std::uint32_t        ceiling,
                         const KeepFn&        keep = {});

} // namespace kinship::graph
