#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/graph_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/discovery.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/util/time.hpp"
#include "kinship/graph/v1.hpp"

namespace kinship::graph {

struct AssemblyOptions {
  // 0 disables the cap.
  std::uint32_t max_results = config::kDefaultMaxResults;

  // Reference date for ages of living persons.
  util::Date as_of = util::Today();
};

// Display attributes derived from a person row.
struct PersonDisplay {
  std::string full_name;

  std::optional<int> birth_year;
  std::optional<int> death_year;

  // Age on the reference date, or years lived for the deceased.
  std::optional<int> age_years;

  bool deceased = false;
};

PersonDisplay DescribePerson(const db::model::PersonRecord& person, const util::Date& as_of);

/*
  Enriches discovery survivors and orders them by depth, then full name,
  then person id. Truncation happens after sorting, so the closest
  relatives are the ones kept. Address lookups run only for kept entries.

  Lookup misses and lookup failures leave fields empty; the person is
  still reported.
*/
kinship::graph::v1::FindRelativesResponse AssembleRelatives(db::Repository&        repository,
                                                            db::Transaction&       tx,
                                                            const std::string&     root_id,
                                                            const DiscoveryResult& discovery,
                                                            const AssemblyOptions& options);

// Enriches every step of the path. No truncation.
kinship::graph::v1::FindPathResponse AssemblePath(db::Repository&   repository,
                                                  db::Transaction&  tx,
                                                  const PathResult& path,
                                                  std::uint32_t     max_hops,
                                                  const util::Date& as_of);

/*
  Exploration graph for a partner search: the seeker followed by the
  discovered persons in breadth-first order, each linked to the node it was
  reached from. With prune set, only the nodes on a match's chain back to
  the seeker are kept; with no matches that leaves the seeker alone.
*/
kinship::graph::v1::PartnerMatchResponse AssembleMatchGraph(db::Repository&                 repository,
                                                            db::Transaction&                tx,
                                                            const std::string&              seeker_id,
                                                            const DiscoveryResult&          discovery,
                                                            const std::vector<std::string>& matches,
                                                            bool                            prune,
                                                            const util::Date&               as_of);

} // namespace kinship::graph
