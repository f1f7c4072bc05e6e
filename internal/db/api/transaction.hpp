#pragma once

namespace relaystore::db {

/*
  Abstract transaction scope.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite:   BEGIN IMMEDIATE (write), BEGIN DEFERRED on a private connection (snapshot)
  Postgres: pqxx::work on a pooled connection
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;
};

} // namespace relaystore::db
