#include "internal/graph/discovery.hpp"

#include <queue>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace kinship::graph {

using kinship::observability::IntField;
using kinship::observability::StringField;

std::uint32_t EffectiveDepth(std::uint32_t requested_depth, std::uint32_t ceiling) {
  if (requested_depth < 1) {
    throw util::InvalidArgument("depth must be at least 1");
  }
  if (ceiling > 0 && requested_depth > ceiling) {
    return ceiling;
  }
  return requested_depth;
}

DepthMode NormalizeDepthMode(DepthMode mode) {
  switch (mode) {
    case kinship::graph::v1::DEPTH_MODE_UNSPECIFIED:
    case kinship::graph::v1::DEPTH_MODE_UP_TO:
      return kinship::graph::v1::DEPTH_MODE_UP_TO;
    case kinship::graph::v1::DEPTH_MODE_ONLY_AT:
      return kinship::graph::v1::DEPTH_MODE_ONLY_AT;
    default:
      throw util::InvalidDepthMode("unknown depth mode " + std::to_string(static_cast<int>(mode)));
  }
}

DiscoveryResult Discover(const AdjacencyView& view,
                         const std::string&   root_id,
                         std::uint32_t        max_depth,
                         DepthMode            depth_mode,
                         std::uint32_t        ceiling,
                         const KeepFn&        keep) {
  DiscoveryResult result;
  result.depth_mode      = NormalizeDepthMode(depth_mode);
  result.requested_depth = max_depth;
  result.effective_depth = EffectiveDepth(max_depth, ceiling);
  result.depth_clamped   = result.effective_depth != max_depth;

  if (result.depth_clamped) {
    KINSHIP_LOG_WARN("discovery depth clamped",
                     {StringField("root", root_id),
                      IntField("requested", max_depth),
                      IntField("ceiling", result.effective_depth)});
  }

  if (!view.Contains(root_id)) {
    throw util::PersonNotFound("person not found: " + root_id);
  }

  std::unordered_map<std::string, std::uint32_t> depth_of;
  std::vector<DiscoveredPerson>                  order;
  std::queue<std::string>                        pending;

  depth_of.emplace(root_id, 0);
  pending.push(root_id);

  while (!pending.empty()) {
    auto current = std::move(pending.front());
    pending.pop();

    const auto depth = depth_of.at(current);
    if (depth >= result.effective_depth) {
      continue;
    }

    for (const auto& neighbor : view.NeighborsOf(current)) {
      if (!depth_of.try_emplace(neighbor.id, depth + 1).second) {
        continue;
      }
      order.push_back(DiscoveredPerson{neighbor.id, depth + 1, current, neighbor.kind, neighbor.reverse_kind});
      pending.push(neighbor.id);
    }
  }

  result.visited_count = depth_of.size();

  for (auto& discovered : order) {
    if (result.depth_mode == kinship::graph::v1::DEPTH_MODE_ONLY_AT && discovered.depth != result.effective_depth) {
      continue;
    }
    if (keep && !keep(discovered.person_id)) {
      continue;
    }
    result.relatives.push_back(std::move(discovered));
  }

  return result;
}

} // namespace kinship::graph
