#pragma once

namespace kinship::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Reads see one consistent snapshot for the lifetime of the transaction
  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN DEFERRED (readers never take the write lock)
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
