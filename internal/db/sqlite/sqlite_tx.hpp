#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace relaystore::db::sqlite {

/*
  SQLite transaction wrapper.

  kImmediate (BEGIN IMMEDIATE):
    - grabs write lock early
    - avoids deadlock-y behavior later

  kDeferred (BEGIN DEFERRED):
    - read snapshot taken at the first SELECT
    - used on a private connection for streaming scans
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kImmediate, kDeferred };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kImmediate);
  ~SqliteTransaction();

  SqliteDB& DB() const { return *db_; }
  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

}
