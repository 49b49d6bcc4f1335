#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/graph/adjacency_view.hpp"

namespace kinship::graph {

struct PathStep {
  std::string person_id;

  // Who this person is to the previous step. UNSPECIFIED on the first step.
  model::RelationshipKind incoming_kind = kinship::graph::v1::RELATIONSHIP_KIND_UNSPECIFIED;
};

struct PathResult {
  bool connection_found = false;

  // Both ends named the same person.
  bool trivial = false;

  std::string meeting_person_id;

  // A first, B last. Empty when there is no connection.
  std::vector<PathStep> steps;

  std::size_t HopCount() const {
    return steps.empty() ? 0 : steps.size() - 1;
  }
};

/*
  Shortest labeled path between a and b.

  Bidirectional BFS: each round expands one full layer of the smaller
  frontier (a's side on ties) and stops at the first newly discovered
  person the other side has already visited. Paths longer than max_hops
  are not searched for; max_hops of 0 means unbounded.

  Throws util::PersonNotFound when either end is not in the view.
*/
PathResult FindPath(const AdjacencyView& view, const std::string& a, const std::string& b, std::uint32_t max_hops);

} // namespace kinship::graph
