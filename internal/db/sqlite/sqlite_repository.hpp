#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace kinship::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::vector<model::RelationshipRecord> LoadAllEdges(Transaction&) override;
  std::vector<model::RelationshipRecord> LoadEdgesTouching(Transaction&, const std::string& person_id) override;

  std::optional<model::PersonRecord> LookupPerson(Transaction&, const std::string& id) override;
  std::optional<model::AddressRecord> LookupCurrentAddress(Transaction&, const std::string& person_id) override;
  std::optional<model::ReligionRecord> LookupReligion(Transaction&, const std::string& person_id) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
