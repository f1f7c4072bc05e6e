#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relaystore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode) : db_(std::move(db)) {
  db_->Exec(mode == Mode::kImmediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  // some errors (IOERR, FULL, BUSY) already rolled the transaction back
  if (sqlite3_get_autocommit(db_->Handle())) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    RELAYSTORE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  if (!sqlite3_get_autocommit(db_->Handle())) {
    db_->Exec("ROLLBACK;");
  }
}

} // namespace relaystore::db::sqlite
