#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace kinship::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS person (id TEXT PRIMARY KEY, first_name TEXT NOT NULL, middle_name TEXT, last_name TEXT NOT NULL, gender_id TEXT NOT NULL, date_of_birth TEXT NOT NULL, date_of_death TEXT, marital_status TEXT NOT NULL DEFAULT 'unknown');",
      "CREATE TABLE IF NOT EXISTS person_relationship (id TEXT PRIMARY KEY, person_id TEXT NOT NULL REFERENCES person(id), related_person_id TEXT NOT NULL REFERENCES person(id), relationship_type TEXT NOT NULL, is_active INTEGER NOT NULL DEFAULT 1);",
      "CREATE INDEX IF NOT EXISTS ix_person_relationship_person_id ON person_relationship(person_id);",
      "CREATE INDEX IF NOT EXISTS ix_person_relationship_related_person_id ON person_relationship(related_person_id);",
      "CREATE TABLE IF NOT EXISTS address_country (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS address_state (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS address_district (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS address_sub_district (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS address_locality (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS person_address (id TEXT PRIMARY KEY, person_id TEXT NOT NULL REFERENCES person(id), country_id TEXT NOT NULL, state_id TEXT, district_id TEXT, sub_district_id TEXT, locality_id TEXT, is_current INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS ix_person_address_person_id ON person_address(person_id);",
      "CREATE TABLE IF NOT EXISTS religion (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS religion_category (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS religion_sub_category (id TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS person_religion (id TEXT PRIMARY KEY, person_id TEXT NOT NULL REFERENCES person(id), religion_id TEXT, religion_category_id TEXT, religion_sub_category_id TEXT);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace kinship::db::sqlite
