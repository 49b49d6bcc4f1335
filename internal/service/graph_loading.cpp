#include "internal/service/graph_loading.hpp"

#include <unordered_set>
#include <utility>

namespace kinship::service {

graph::AdjacencyView LoadView(db::Repository&                               repository,
                              db::Transaction&                              tx,
                              const std::vector<db::model::RelationshipRecord>& edges,
                              const model::GenderIds&                       gender_ids,
                              std::initializer_list<std::string>            seeds) {
  graph::GenderIndex genders;
  for (const auto& edge : edges) {
    if (genders.contains(edge.person_id)) {
      continue;
    }
    const auto person = repository.LookupPerson(tx, edge.person_id);
    genders.emplace(edge.person_id, person ? model::ResolveGender(person->gender_id, gender_ids) : model::Gender::kUnknown);
  }

  auto view = graph::AdjacencyView::Build(edges, genders);
  for (const auto& seed : seeds) {
    view.AddPerson(seed);
  }
  return view;
}

std::vector<db::model::RelationshipRecord> MergeEdges(std::vector<db::model::RelationshipRecord> lhs,
                                                      std::vector<db::model::RelationshipRecord> rhs) {
  std::unordered_set<std::string> seen;
  for (const auto& edge : lhs) {
    seen.insert(edge.id);
  }
  for (auto& edge : rhs) {
    if (edge.id.empty() || seen.insert(edge.id).second) {
      lhs.push_back(std::move(edge));
    }
  }
  return lhs;
}

} // namespace kinship::service
