#pragma once

#include <memory>
#include <string>

#include "internal/db/api/schema_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relaystore::db::sqlite {

/*
  SQLite implementation.

  Begin() scopes share the primary connection. BeginSnapshot() opens a
  private connection on the same file, so the path must name a real file
  (":memory:" databases are per-connection).
*/
class SqliteSchemaRepository final : public db::SchemaRepository {
public:
  explicit SqliteSchemaRepository(std::shared_ptr<SqliteDB> db);

  Dialect Backend() const override { return Dialect::kSqlite; }

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginSnapshot() override;

  Result EnsureLedger() override;
  Result Execute(Transaction&, const std::string& sql) override;
  bool IsApplied(Transaction&, int64_t serial_number) override;
  Result RecordApplied(Transaction&, int64_t serial_number) override;
  std::optional<int64_t> MaxApplied(Transaction&) override;
  std::vector<int64_t> ListApplied(Transaction&) override;

  uint64_t CountEvents(Transaction&) override;
  Result ScanEvents(Transaction&, std::size_t batch_size, const EventVisitor& visit) override;
  Result InsertEvent(Transaction&, const model::EventRecord&) override;

  Result DeleteAllTags(Transaction&) override;
  Result InsertTag(Transaction&, const model::TagRecord&) override;
  std::vector<model::TagRecord> ListTags(Transaction&, const std::string& event_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
