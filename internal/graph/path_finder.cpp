#include "internal/graph/path_finder.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <utility>

#include "internal/util/errors.hpp"

namespace kinship::graph {

namespace {

struct Visit {
  std::string             predecessor;
  model::RelationshipKind label = kinship::graph::v1::RELATIONSHIP_KIND_UNSPECIFIED;
  std::uint32_t           depth = 0;
};

using VisitMap = std::unordered_map<std::string, Visit>;

struct Side {
  VisitMap                 visited;
  std::vector<std::string> frontier;
  std::uint32_t            depth = 0;

  explicit Side(const std::string& seed) {
    visited.emplace(seed, Visit{});
    frontier.push_back(seed);
  }
};

/*
  Expands one whole layer of `side`. On a's side a visit is labeled with
  who the new person is to its predecessor; on b's side with who the
  predecessor is to the new person, which is the label the path needs when
  walking from the meeting point towards b.
*/
std::optional<std::string> ExpandLayer(const AdjacencyView& view, Side& side, const Side& other, bool from_a) {
  std::vector<std::string>   next;
  std::optional<std::string> meeting;

  for (const auto& current : side.frontier) {
    for (const auto& neighbor : view.NeighborsOf(current)) {
      const auto label = from_a ? neighbor.kind : neighbor.reverse_kind;
      if (!side.visited.try_emplace(neighbor.id, Visit{current, label, side.depth + 1}).second) {
        continue;
      }
      next.push_back(neighbor.id);
      if (!meeting && other.visited.contains(neighbor.id)) {
        meeting = neighbor.id;
      }
    }
  }

  ++side.depth;
  side.frontier = std::move(next);
  return meeting;
}

std::vector<PathStep> Reconstruct(const Side& from_a, const Side& from_b, const std::string& meeting) {
  std::vector<PathStep> steps;

  for (auto id = meeting;;) {
    const auto& visit = from_a.visited.at(id);
    steps.push_back(PathStep{id, visit.label});
    if (visit.predecessor.empty()) {
      break;
    }
    id = visit.predecessor;
  }
  std::reverse(steps.begin(), steps.end());

  for (auto id = meeting;;) {
    const auto& visit = from_b.visited.at(id);
    if (visit.predecessor.empty()) {
      break;
    }
    steps.push_back(PathStep{visit.predecessor, visit.label});
    id = visit.predecessor;
  }

  return steps;
}

} // namespace

PathResult FindPath(const AdjacencyView& view, const std::string& a, const std::string& b, std::uint32_t max_hops) {
  if (!view.Contains(a)) {
    throw util::PersonNotFound("person not found: " + a);
  }
  if (!view.Contains(b)) {
    throw util::PersonNotFound("person not found: " + b);
  }

  PathResult result;

  if (a == b) {
    result.trivial           = true;
    result.meeting_person_id = a;
    result.steps.push_back(PathStep{a});
    return result;
  }

  Side from_a(a);
  Side from_b(b);

  while (!from_a.frontier.empty() && !from_b.frontier.empty()) {
    // The next round can only find paths of length depth_a + depth_b + 1.
    if (max_hops > 0 && from_a.depth + from_b.depth >= max_hops) {
      break;
    }

    const bool expand_a = from_a.frontier.size() <= from_b.frontier.size();
    const auto meeting  = expand_a ? ExpandLayer(view, from_a, from_b, true) : ExpandLayer(view, from_b, from_a, false);

    if (meeting) {
      result.connection_found  = true;
      result.meeting_person_id = *meeting;
      result.steps             = Reconstruct(from_a, from_b, *meeting);
      return result;
    }
  }

  return result;
}

} // namespace kinship::graph
