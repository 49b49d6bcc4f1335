#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"

namespace kinship::db::memory {

class MemoryTransaction;

/*
  In-process person store.

  Reads go through the Repository interface. The Insert/Upsert methods are
  the seeding side used by tests and embedders; they are not part of the
  contract the graph engine consumes.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::vector<model::RelationshipRecord> LoadAllEdges(Transaction&) override;
  std::vector<model::RelationshipRecord> LoadEdgesTouching(Transaction&, const std::string& person_id) override;

  std::optional<model::PersonRecord> LookupPerson(Transaction&, const std::string& id) override;
  std::optional<model::AddressRecord> LookupCurrentAddress(Transaction&, const std::string& person_id) override;
  std::optional<model::ReligionRecord> LookupReligion(Transaction&, const std::string& person_id) override;

  Result InsertPerson(Transaction&, const model::PersonRecord&);
  Result InsertRelationship(Transaction&, const model::RelationshipRecord&);
  Result UpsertCurrentAddress(Transaction&, const model::AddressRecord&);
  Result UpsertReligion(Transaction&, const model::ReligionRecord&);

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::PersonRecord> persons;
    std::vector<model::RelationshipRecord> relationships;
    // person id -> positions in relationships, both endpoints
    std::unordered_map<std::string, std::vector<std::size_t>> edges_by_person;
    std::unordered_set<std::string> relationship_ids;
    std::unordered_map<std::string, model::AddressRecord> addresses;
    std::unordered_map<std::string, model::ReligionRecord> religions;
    uint64_t next_relationship_id = 1;
  };

  // Published state is immutable; a writer copies it on first write.
  std::mutex mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t committed_version_ = 0;
};

}
