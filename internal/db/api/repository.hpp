#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/model/address_record.hpp"
#include "internal/db/model/person_record.hpp"
#include "internal/db/model/relationship_record.hpp"
#include "internal/db/model/religion_record.hpp"

namespace kinship::db {

/*
  Read-only view of the person store.

  GUARANTEES the graph engine relies on:

  - Edge loaders return active rows only
  - Rows come back as stored; inverse rows are NOT synthesized
  - Lookups inside one transaction see one snapshot

  The person store stays the source of truth for persons, relationships,
  addresses and religions. Nothing here writes.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Relationship edges
  // ---------------------------------------------------------------------

  virtual std::vector<model::RelationshipRecord> LoadAllEdges(Transaction&) = 0;

  // Edges where the person is either endpoint.
  virtual std::vector<model::RelationshipRecord> LoadEdgesTouching(Transaction&, const std::string& person_id) = 0;

  // Every edge incident to a person fewer than max_depth hops from the seed.
  // That is exactly the edge set a BFS bounded at max_depth can traverse.
  std::vector<model::RelationshipRecord> LoadEdgesNear(Transaction&, const std::string& person_id, std::uint32_t max_depth);

  // ---------------------------------------------------------------------
  // Person attributes
  // ---------------------------------------------------------------------

  virtual std::optional<model::PersonRecord> LookupPerson(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::AddressRecord> LookupCurrentAddress(Transaction&, const std::string& person_id) = 0;

  virtual std::optional<model::ReligionRecord> LookupReligion(Transaction&, const std::string& person_id) = 0;

  // "Locality, Sub-district, District, State, Country"; empty when unknown.
  std::string LookupAddressSummary(Transaction&, const std::string& person_id);

  // "Religion, Category, Sub-category"; empty when unknown.
  std::string LookupReligionSummary(Transaction&, const std::string& person_id);
};

std::string FormatAddressSummary(const model::AddressRecord& address);
std::string FormatReligionSummary(const model::ReligionRecord& religion);

} // namespace kinship::db
