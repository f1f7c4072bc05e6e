#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace relaystore::db::postgres {

class PgTransaction final : public db::Transaction {
public:
  enum class Mode { kReadWrite, kSnapshot };

  explicit PgTransaction(std::shared_ptr<PgPool> pool, Mode mode = Mode::kReadWrite);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool finished_ = false;
};

}
