#include "internal/db/api/repository.hpp"

#include <initializer_list>
#include <unordered_set>

namespace kinship::db {

namespace {

std::string JoinNonEmpty(std::initializer_list<const std::string*> parts) {
  std::string out;
  for (const auto* part : parts) {
    if (part->empty()) continue;
    if (!out.empty()) out += ", ";
    out += *part;
  }
  return out;
}

} // namespace

std::vector<model::RelationshipRecord> Repository::LoadEdgesNear(Transaction& tx, const std::string& person_id, std::uint32_t max_depth) {
  std::vector<model::RelationshipRecord> out;
  std::unordered_set<std::string>        seen_edges;
  std::unordered_set<std::string>        visited{person_id};
  std::vector<std::string>               frontier{person_id};

  for (std::uint32_t depth = 0; depth < max_depth && !frontier.empty(); ++depth) {
    std::vector<std::string> next_frontier;
    for (const auto& node : frontier) {
      for (auto& edge : LoadEdgesTouching(tx, node)) {
        const auto& other = edge.person_id == node ? edge.related_person_id : edge.person_id;
        if (visited.insert(other).second) {
          next_frontier.push_back(other);
        }
        // Rows without an id cannot be matched across frontiers; keep them all.
        if (edge.id.empty() || seen_edges.insert(edge.id).second) {
          out.push_back(std::move(edge));
        }
      }
    }
    frontier.swap(next_frontier);
  }

  return out;
}

std::string Repository::LookupAddressSummary(Transaction& tx, const std::string& person_id) {
  const auto address = LookupCurrentAddress(tx, person_id);
  return address ? FormatAddressSummary(*address) : std::string{};
}

std::string Repository::LookupReligionSummary(Transaction& tx, const std::string& person_id) {
  const auto religion = LookupReligion(tx, person_id);
  return religion ? FormatReligionSummary(*religion) : std::string{};
}

std::string FormatAddressSummary(const model::AddressRecord& address) {
  return JoinNonEmpty({&address.locality_name, &address.sub_district_name, &address.district_name, &address.state_name, &address.country_name});
}

std::string FormatReligionSummary(const model::ReligionRecord& religion) {
  return JoinNonEmpty({&religion.religion_name, &religion.category_name, &religion.sub_category_name});
}

} // namespace kinship::db
