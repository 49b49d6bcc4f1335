#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/relationship_record.hpp"
#include "internal/model/relationship.hpp"

namespace kinship::graph {

// Person id -> gender, resolved before the view is built.
using GenderIndex = std::unordered_map<std::string, model::Gender>;

enum class Direction : std::uint8_t {
  kForward  = 0, // entry comes from an edge stored on the owner
  kBackward = 1, // entry was derived by inverting an edge stored on the neighbor
};

struct Neighbor {
  std::string id;

  // Who the neighbor is to the owner.
  model::RelationshipKind kind = kinship::graph::v1::RELATIONSHIP_KIND_UNSPECIFIED;

  // Who the owner is to the neighbor.
  model::RelationshipKind reverse_kind = kinship::graph::v1::RELATIONSHIP_KIND_UNSPECIFIED;

  Direction direction = Direction::kForward;
};

/*
  Symmetric adjacency over relationship edges.

  For every stored edge (u, v, kind):

    adjacency[u] holds (v, kind,            forward)
    adjacency[v] holds (u, inverse(kind),   backward)

  Each list is sorted by (neighbor id, kind, direction). Parallel edges
  between the same pair stay separate entries unless they carry the same
  kind, in which case the forward entry survives.

  The view is immutable once built and owned by a single query.
*/
class AdjacencyView {
 public:
  // Throws util::MalformedEdge when any edge has an empty endpoint or an
  // unknown kind. Self loops are skipped with a warning.
  static AdjacencyView Build(const std::vector<db::model::RelationshipRecord>& edges, const GenderIndex& genders);

  // Registers a person with no edges so traversals can start from it.
  void AddPerson(const std::string& person_id);

  bool Contains(const std::string& person_id) const;

  // Empty for persons the view does not know.
  const std::vector<Neighbor>& NeighborsOf(const std::string& person_id) const;

  std::size_t PersonCount() const {
    return adjacency_.size();
  }

  std::size_t EntryCount() const;

 private:
  std::unordered_map<std::string, std::vector<Neighbor>> adjacency_;
};

} // namespace kinship::graph
