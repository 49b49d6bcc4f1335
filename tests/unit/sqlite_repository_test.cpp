#include "internal/db/sqlite/sqlite_repository.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using kinship::db::sqlite::SqliteDB;
using kinship::db::sqlite::SqliteRepository;

std::filesystem::path FreshDatabasePath(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "kinship_sqlite_repository_tests";
  std::filesystem::create_directories(base_dir);

  const auto path = base_dir / (test_name + ".db");
  for (const auto* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

std::shared_ptr<SqliteDB> OpenSeeded(const std::string& test_name) {
  auto db = std::make_shared<SqliteDB>(FreshDatabasePath(test_name).string());
  kinship::db::sqlite::BootstrapSchema(*db);

  db->Exec(
      "INSERT INTO person (id, first_name, middle_name, last_name, gender_id, date_of_birth, date_of_death) VALUES "
      "('p1', 'Ravi', NULL, 'Kumar', 'm', '1950-02-01', NULL),"
      "('p2', 'Sita', 'Devi', 'Kumar', 'f', '1955-03-04', '2010-07-08'),"
      "('p3', 'Arun', NULL, 'Kumar', 'm', '1980-05-06', NULL),"
      "('p4', 'Meena', NULL, 'Rao', 'f', '1982-09-10', NULL);");
  db->Exec("UPDATE person SET marital_status='married' WHERE id='p3';");

  db->Exec(
      "INSERT INTO person_relationship (id, person_id, related_person_id, relationship_type, is_active) VALUES "
      "('r1', 'p1', 'p2', 'rel-6a0ede824d105', 1),"
      "('r2', 'p3', 'p1', 'rel-6a0ede824d101', 1),"
      "('r3', 'p3', 'p4', 'wife', 1),"
      "('r4', 'p4', 'p2', 'mother', 0);");

  db->Exec("INSERT INTO address_country (id, name) VALUES ('in', 'India');");
  db->Exec("INSERT INTO address_state (id, name) VALUES ('ka', 'Karnataka');");
  db->Exec("INSERT INTO address_district (id, name) VALUES ('blr', 'Bengaluru Urban');");
  db->Exec("INSERT INTO address_locality (id, name) VALUES ('jay', 'Jayanagar');");
  db->Exec(
      "INSERT INTO person_address (id, person_id, country_id, state_id, district_id, sub_district_id, locality_id, is_current) VALUES "
      "('a1', 'p1', 'in', 'ka', 'blr', NULL, 'jay', 1),"
      "('a2', 'p3', 'in', 'ka', 'old', NULL, NULL, 0);");

  db->Exec("INSERT INTO religion (id, name) VALUES ('hin', 'Hindu');");
  db->Exec("INSERT INTO religion_category (id, name) VALUES ('vai', 'Vaishnava');");
  db->Exec("INSERT INTO person_religion (id, person_id, religion_id, religion_category_id, religion_sub_category_id) VALUES "
           "('pr1', 'p1', 'hin', 'vai', NULL);");

  return db;
}

std::vector<std::string> Ids(const std::vector<kinship::db::model::RelationshipRecord>& edges) {
  std::vector<std::string> ids;
  for (const auto& edge : edges) ids.push_back(edge.id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

void TestEdgesAreActiveRowsAsStored() {
  SqliteRepository repo(OpenSeeded("edges"));
  auto             tx = repo.Begin();

  auto all = repo.LoadAllEdges(*tx);
  assert((Ids(all) == std::vector<std::string>{"r1", "r2", "r3"}));
  assert(all[0].relationship_type == "rel-6a0ede824d105");
  assert(all[0].is_active);

  assert((Ids(repo.LoadEdgesTouching(*tx, "p1")) == std::vector<std::string>{"r1", "r2"}));
  assert((Ids(repo.LoadEdgesTouching(*tx, "p4")) == std::vector<std::string>{"r3"}));
  assert((Ids(repo.LoadEdgesNear(*tx, "p4", 2)) == std::vector<std::string>{"r2", "r3"}));

  tx->Commit();
}

void TestPersonLookup() {
  SqliteRepository repo(OpenSeeded("person"));
  auto             tx = repo.Begin();

  auto ravi = repo.LookupPerson(*tx, "p1");
  assert(ravi.has_value());
  assert(ravi->first_name == "Ravi");
  assert(ravi->middle_name.empty());
  assert(ravi->gender_id == "m");
  assert(ravi->date_of_birth == "1950-02-01");
  assert(ravi->date_of_death.empty());
  assert(ravi->marital_status == "unknown");
  assert(repo.LookupPerson(*tx, "p3")->marital_status == "married");

  auto sita = repo.LookupPerson(*tx, "p2");
  assert(sita.has_value());
  assert(sita->middle_name == "Devi");
  assert(sita->date_of_death == "2010-07-08");

  assert(!repo.LookupPerson(*tx, "nobody").has_value());
}

void TestCurrentAddressAndReligion() {
  SqliteRepository repo(OpenSeeded("address"));
  auto             tx = repo.Begin();

  auto address = repo.LookupCurrentAddress(*tx, "p1");
  assert(address.has_value());
  assert(address->country_id == "in");
  assert(address->district_id == "blr");
  assert(address->sub_district_id.empty());
  assert(address->district_name == "Bengaluru Urban");
  assert(address->locality_name == "Jayanagar");
  assert(repo.LookupAddressSummary(*tx, "p1") == "Jayanagar, Bengaluru Urban, Karnataka, India");

  // Only the current address counts.
  assert(!repo.LookupCurrentAddress(*tx, "p3").has_value());
  assert(repo.LookupAddressSummary(*tx, "p3").empty());

  assert(repo.LookupReligionSummary(*tx, "p1") == "Hindu, Vaishnava");
  auto religion = repo.LookupReligion(*tx, "p1");
  assert(religion->religion_id == "hin");
  assert(religion->category_id == "vai");
  assert(religion->sub_category_id.empty());
  assert(!repo.LookupReligion(*tx, "p2").has_value());
}

void TestSequentialTransactionsOnOneConnection() {
  auto             db = OpenSeeded("sequential");
  SqliteRepository repo(db);

  {
    auto tx = repo.Begin();
    assert(repo.LoadAllEdges(*tx).size() == 3);
    tx->Commit();
  }

  db->Exec("UPDATE person_relationship SET is_active=0 WHERE id='r3';");

  {
    // Dropped without commit; the destructor rolls back.
    auto tx = repo.Begin();
    assert(repo.LoadAllEdges(*tx).size() == 2);
  }

  auto tx = repo.Begin();
  assert(repo.LoadEdgesTouching(*tx, "p4").empty());
  tx->Rollback();
}

void TestStatementErrorsAreReported() {
  // No schema: every statement fails to prepare.
  SqliteRepository repo(std::make_shared<SqliteDB>(FreshDatabasePath("no_schema").string()));
  auto             tx = repo.Begin();

  bool threw = false;
  try {
    (void)repo.LoadAllEdges(*tx);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("sqlite prepare") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    (void)repo.LookupPerson(*tx, "p1");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEdgesAreActiveRowsAsStored();
  TestPersonLookup();
  TestCurrentAddressAndReligion();
  TestSequentialTransactionsOnOneConnection();
  TestStatementErrorsAreReported();

  std::cout << "kinship_unit_sqlite_repository: pass\n";
  return 0;
}
