#pragma once

#include "internal/db/api/schema_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace relaystore::db::postgres {

/*
  PostgreSQL implementation.

  Byte columns travel as hex text (encode/decode on the server side) so no
  binary parameter formats are involved.
*/
class PgSchemaRepository final : public db::SchemaRepository {
public:
  explicit PgSchemaRepository(std::shared_ptr<PgPool> pool);

  Dialect Backend() const override { return Dialect::kPostgres; }

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
