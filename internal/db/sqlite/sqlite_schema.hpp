#pragma once

#include "sqlite_db.hpp"

namespace kinship::db::sqlite {

/*
  Creates the person store tables the repository reads, if missing.

  The person store owns this layout; bootstrapping only exists so a fresh
  file (tests, local experiments) can be queried.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace kinship::db::sqlite
