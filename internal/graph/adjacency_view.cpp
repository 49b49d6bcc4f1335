#include "internal/graph/adjacency_view.hpp"

#include <algorithm>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace kinship::graph {

using kinship::observability::StringField;

namespace {

const std::vector<Neighbor> kNoNeighbors;

model::Gender GenderOf(const GenderIndex& genders, const std::string& person_id) {
  auto it = genders.find(person_id);
  return it == genders.end() ? model::Gender::kUnknown : it->second;
}

std::string Describe(const db::model::RelationshipRecord& edge) {
  return "edge '" + edge.id + "' (" + edge.person_id + " -> " + edge.related_person_id + ")";
}

bool NeighborLess(const Neighbor& lhs, const Neighbor& rhs) {
  return std::tie(lhs.id, lhs.kind, lhs.direction) < std::tie(rhs.id, rhs.kind, rhs.direction);
}

bool SameRelation(const Neighbor& lhs, const Neighbor& rhs) {
  return lhs.id == rhs.id && lhs.kind == rhs.kind;
}

} // namespace

AdjacencyView AdjacencyView::Build(const std::vector<db::model::RelationshipRecord>& edges, const GenderIndex& genders) {
  AdjacencyView view;

  for (const auto& edge : edges) {
    if (!edge.is_active) {
      continue;
    }

    if (edge.person_id.empty() || edge.related_person_id.empty()) {
      throw util::MalformedEdge(Describe(edge) + " has an empty endpoint");
    }

    const auto kind = model::ParseRelationshipKind(edge.relationship_type);
    if (!kind) {
      throw util::MalformedEdge(Describe(edge) + " has unknown relationship type '" + edge.relationship_type + "'");
    }

    // A self loop adds no reachability; the person still joins the view.
    if (edge.person_id == edge.related_person_id) {
      KINSHIP_LOG_WARN("skipping self-referencing relationship",
                       {StringField("edge_id", edge.id), StringField("person_id", edge.person_id)});
      view.adjacency_.try_emplace(edge.person_id);
      continue;
    }

    const auto inverse = model::InverseKind(*kind, GenderOf(genders, edge.person_id));

    view.adjacency_[edge.person_id].push_back(Neighbor{edge.related_person_id, *kind, inverse, Direction::kForward});
    view.adjacency_[edge.related_person_id].push_back(Neighbor{edge.person_id, inverse, *kind, Direction::kBackward});
  }

  // Forward sorts ahead of backward, so unique() keeps the stored entry.
  for (auto& [owner, neighbors] : view.adjacency_) {
    std::sort(neighbors.begin(), neighbors.end(), NeighborLess);
    neighbors.erase(std::unique(neighbors.begin(), neighbors.end(), SameRelation), neighbors.end());
  }

  return view;
}

void AdjacencyView::AddPerson(const std::string& person_id) {
  adjacency_.try_emplace(person_id);
}

bool AdjacencyView::Contains(const std::string& person_id) const {
  return adjacency_.contains(person_id);
}

const std::vector<Neighbor>& AdjacencyView::NeighborsOf(const std::string& person_id) const {
  auto it = adjacency_.find(person_id);
  return it == adjacency_.end() ? kNoNeighbors : it->second;
}

std::size_t AdjacencyView::EntryCount() const {
  std::size_t count = 0;
  for (const auto& [owner, neighbors] : adjacency_) {
    count += neighbors.size();
  }
  return count;
}

} // namespace kinship::graph
