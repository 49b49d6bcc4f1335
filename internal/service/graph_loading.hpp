#pragma once

#include <chrono>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/adjacency_view.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace kinship::service {

/*
  Builds the adjacency view for one query.

  Genders of every edge source are resolved up front so the normalizer can
  pick gendered inverse labels. The seeds are registered even when they have
  no edges.
*/
graph::AdjacencyView LoadView(db::Repository&                               repository,
                              db::Transaction&                              tx,
                              const std::vector<db::model::RelationshipRecord>& edges,
                              const model::GenderIds&                       gender_ids,
                              std::initializer_list<std::string>            seeds);

// Union of two edge sets, deduplicated by edge id.
std::vector<db::model::RelationshipRecord> MergeEdges(std::vector<db::model::RelationshipRecord> lhs,
                                                      std::vector<db::model::RelationshipRecord> rhs);

// Logs the outcome and latency of a query; failures are logged and rethrown.
template <typename Fn>
auto ObserveQuery(std::string_view route, const std::string& person_id, Fn&& fn) {
  using kinship::observability::IntField;
  using kinship::observability::StringField;

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    KINSHIP_LOG_DEBUG("query completed",
                      {StringField("route", route), StringField("person_id", person_id), IntField("elapsed_ms", elapsed_ms())});
    return result;
  } catch (const std::exception& ex) {
    KINSHIP_LOG_ERROR("query failed",
                      {StringField("route", route),
                       StringField("person_id", person_id),
                       StringField("class", util::ToString(util::Classify(ex))),
                       StringField("error", ex.what()),
                       IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace kinship::service
