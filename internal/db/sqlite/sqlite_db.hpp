#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace kinship::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(const std::string& path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // One connection runs one transaction at a time.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize). Throws on failure.
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*   db_ = nullptr;
  std::mutex tx_mutex_;
};

} // namespace kinship::db::sqlite
