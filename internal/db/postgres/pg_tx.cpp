#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relaystore::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, Mode mode)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
  if (mode == Mode::kSnapshot) {
    tx_->exec("SET TRANSACTION ISOLATION LEVEL REPEATABLE READ, READ ONLY;");
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      RELAYSTORE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
