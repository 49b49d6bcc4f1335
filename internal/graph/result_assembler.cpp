#include "internal/graph/result_assembler.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace kinship::graph {

using kinship::observability::StringField;

namespace {

/*
  Runs one enrichment lookup. A failure degrades to an empty value so a
  single bad row never fails the query.
*/
template <typename Lookup>
auto TolerantLookup(std::string_view what, const std::string& person_id, Lookup&& lookup) -> decltype(lookup()) {
  try {
    return lookup();
  } catch (const std::exception& e) {
    KINSHIP_LOG_WARN("enrichment lookup failed",
                     {StringField("lookup", what), StringField("person_id", person_id), StringField("error", e.what())});
    return {};
  }
}

std::string FullName(const db::model::PersonRecord& person) {
  std::string out;
  for (const auto* part : {&person.first_name, &person.middle_name, &person.last_name}) {
    if (part->empty()) continue;
    if (!out.empty()) out += ' ';
    out += *part;
  }
  return out;
}

struct Candidate {
  DiscoveredPerson                         discovered;
  std::optional<db::model::PersonRecord> person;
  std::string                              full_name;
};

bool CandidateLess(const Candidate& lhs, const Candidate& rhs) {
  return std::tie(lhs.discovered.depth, lhs.full_name, lhs.discovered.person_id) <
         std::tie(rhs.discovered.depth, rhs.full_name, rhs.discovered.person_id);
}

template <typename Message>
void FillDisplay(const db::model::PersonRecord& person, const util::Date& as_of, Message* out) {
  const auto display = DescribePerson(person, as_of);

  out->set_first_name(person.first_name);
  out->set_middle_name(person.middle_name);
  out->set_last_name(person.last_name);
  out->set_full_name(display.full_name);
  out->set_deceased(display.deceased);

  if (display.birth_year) out->set_birth_year(*display.birth_year);
  if (display.death_year) out->set_death_year(*display.death_year);
  if (display.age_years) out->set_age_years(*display.age_years);
}

void SetConnection(const std::string& person_id, model::RelationshipKind kind, kinship::graph::v1::MatchConnection* out) {
  out->set_person_id(person_id);
  out->set_relationship(kind);
  out->set_label(std::string(model::RelationshipLabel(kind)));
}

} // namespace

PersonDisplay DescribePerson(const db::model::PersonRecord& person, const util::Date& as_of) {
  PersonDisplay display;
  display.full_name = FullName(person);
  display.deceased  = !person.date_of_death.empty();

  const auto born = util::ParseIsoDate(person.date_of_birth);
  const auto died = util::ParseIsoDate(person.date_of_death);

  if (born) {
    display.birth_year = static_cast<int>(born->year());
  }
  if (died) {
    display.death_year = static_cast<int>(died->year());
  }

  if (born) {
    if (display.deceased) {
      if (died && *died >= *born) {
        display.age_years = util::YearsBetween(*born, *died);
      }
    } else if (as_of >= *born) {
      display.age_years = util::YearsBetween(*born, as_of);
    }
  }

  return display;
}

kinship::graph::v1::FindRelativesResponse AssembleRelatives(db::Repository&        repository,
                                                            db::Transaction&       tx,
                                                            const std::string&     root_id,
                                                            const DiscoveryResult& discovery,
                                                            const AssemblyOptions& options) {
  std::vector<Candidate> candidates;
  candidates.reserve(discovery.relatives.size());

  for (const auto& discovered : discovery.relatives) {
    Candidate candidate{discovered, std::nullopt, {}};
    candidate.person = TolerantLookup("person", discovered.person_id, [&] {
      return repository.LookupPerson(tx, discovered.person_id);
    });
    if (candidate.person) {
      candidate.full_name = FullName(*candidate.person);
    }
    candidates.push_back(std::move(candidate));
  }

  std::sort(candidates.begin(), candidates.end(), CandidateLess);

  const auto matched = candidates.size();
  if (options.max_results > 0 && candidates.size() > options.max_results) {
    candidates.resize(options.max_results);
  }

  kinship::graph::v1::FindRelativesResponse response;
  response.set_person_id(root_id);
  response.set_depth(discovery.effective_depth);
  response.set_depth_mode(discovery.depth_mode);
  response.set_total_count(static_cast<std::uint32_t>(candidates.size()));
  response.set_matched_count(static_cast<std::uint32_t>(matched));
  response.set_truncated(candidates.size() < matched);

  for (const auto& candidate : candidates) {
    auto* info = response.add_relatives();
    info->set_person_id(candidate.discovered.person_id);
    info->set_depth(candidate.discovered.depth);

    if (candidate.person) {
      FillDisplay(*candidate.person, options.as_of, info);
      info->set_gender_id(candidate.person->gender_id);
    }

    const auto address = TolerantLookup("address", candidate.discovered.person_id, [&] {
      return repository.LookupCurrentAddress(tx, candidate.discovered.person_id);
    });
    if (address) {
      info->set_district_name(address->district_name);
      info->set_locality_name(address->locality_name);
      info->set_address(db::FormatAddressSummary(*address));
    }
  }

  return response;
}

kinship::graph::v1::FindPathResponse AssemblePath(db::Repository&   repository,
                                                  db::Transaction&  tx,
                                                  const PathResult& path,
                                                  std::uint32_t     max_hops,
                                                  const util::Date& as_of) {
  kinship::graph::v1::FindPathResponse response;
  response.set_connection_found(path.connection_found);
  response.set_trivial(path.trivial);
  response.set_common_person_id(path.meeting_person_id);
  response.set_person_count(static_cast<std::uint32_t>(path.steps.size()));
  response.set_hop_count(static_cast<std::uint32_t>(path.HopCount()));

  if (path.trivial) {
    response.set_message("Same person provided for both inputs");
  } else if (path.connection_found) {
    response.set_message("Connection found");
  } else {
    response.set_message("No relation found up to " + std::to_string(max_hops) + " hops");
  }

  for (const auto& step : path.steps) {
    auto* node = response.add_path();
    node->set_person_id(step.person_id);
    node->set_incoming_relationship(step.incoming_kind);
    node->set_incoming_label(std::string(model::RelationshipLabel(step.incoming_kind)));

    const auto person = TolerantLookup("person", step.person_id, [&] {
      return repository.LookupPerson(tx, step.person_id);
    });
    if (person) {
      FillDisplay(*person, as_of, node);
    }

    node->set_address(TolerantLookup("address", step.person_id, [&] {
      return repository.LookupAddressSummary(tx, step.person_id);
    }));
    node->set_religion(TolerantLookup("religion", step.person_id, [&] {
      return repository.LookupReligionSummary(tx, step.person_id);
    }));
  }

  return response;
}

kinship::graph::v1::PartnerMatchResponse AssembleMatchGraph(db::Repository&                 repository,
                                                            db::Transaction&                tx,
                                                            const std::string&              seeker_id,
                                                            const DiscoveryResult&          discovery,
                                                            const std::vector<std::string>& matches,
                                                            bool                            prune,
                                                            const util::Date&               as_of) {
  kinship::graph::v1::PartnerMatchResponse response;
  response.set_seeker_id(seeker_id);
  response.set_depth(discovery.effective_depth);
  response.set_total_matches(static_cast<std::uint32_t>(matches.size()));
  for (const auto& id : matches) response.add_matches(id);

  std::unordered_map<std::string, const DiscoveredPerson*> by_id;
  for (const auto& discovered : discovery.relatives) {
    by_id.emplace(discovered.person_id, &discovered);
  }

  const std::unordered_set<std::string> match_set(matches.begin(), matches.end());

  // Walk each match back to the seeker.
  std::unordered_set<std::string> keep{seeker_id};
  for (const auto& id : matches) {
    for (auto it = by_id.find(id); it != by_id.end(); it = by_id.find(it->second->parent_id)) {
      if (!keep.insert(it->first).second) break;
    }
  }
  const auto kept = [&](const std::string& id) { return !prune || keep.contains(id); };

  std::vector<DiscoveredPerson> nodes;
  nodes.push_back(DiscoveredPerson{seeker_id, 0});
  for (const auto& discovered : discovery.relatives) {
    if (kept(discovered.person_id)) nodes.push_back(discovered);
  }

  std::unordered_map<std::string, int> index_of;
  for (const auto& discovered : nodes) {
    auto* node = response.add_exploration_graph();
    index_of.emplace(discovered.person_id, response.exploration_graph_size() - 1);

    node->set_person_id(discovered.person_id);
    node->set_depth(discovered.depth);
    node->set_is_match(match_set.contains(discovered.person_id));

    const auto person = TolerantLookup("person", discovered.person_id, [&] {
      return repository.LookupPerson(tx, discovered.person_id);
    });
    if (person) {
      const auto display = DescribePerson(*person, as_of);
      node->set_first_name(person->first_name);
      node->set_last_name(person->last_name);
      node->set_full_name(display.full_name);
      if (display.birth_year) node->set_birth_year(*display.birth_year);
      if (display.death_year) node->set_death_year(*display.death_year);
    }

    node->set_address(TolerantLookup("address", discovered.person_id, [&] {
      return repository.LookupAddressSummary(tx, discovered.person_id);
    }));
    node->set_religion(TolerantLookup("religion", discovered.person_id, [&] {
      return repository.LookupReligionSummary(tx, discovered.person_id);
    }));

    if (discovered.parent_id.empty()) {
      continue;
    }
    SetConnection(discovered.parent_id, discovered.reverse_kind, node->mutable_from_person());

    // Parents precede their children in breadth-first order.
    auto parent = index_of.find(discovered.parent_id);
    if (parent != index_of.end()) {
      SetConnection(discovered.person_id,
                    discovered.kind,
                    response.mutable_exploration_graph(parent->second)->add_to_persons());
    }
  }

  return response;
}

} // namespace kinship::graph
