#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/tag_record.hpp"

namespace relaystore::db {

enum class Dialect {
  kPostgres,
  kSqlite,
};

const char* DialectName(Dialect dialect);

// Called once per streamed event. A non-OK result stops the scan and is returned from ScanEvents().
using EventVisitor = std::function<Result(const model::EventRecord&)>;

/*
  Repository used by the schema-versioning and backfill engine.

  CRITICAL GUARANTEES:

  - Schema changes and ledger inserts share the caller's Transaction,
    so both persist or neither does
  - Begin() and BeginSnapshot() scopes are independent: a snapshot can
    stream the event table while a Begin() scope writes tags
  - Nothing about the ledger is cached; every call re-reads storage

  Writes return Result. Reads throw util::DatabaseError on backend failure.
*/

class SchemaRepository {
 public:
  virtual ~SchemaRepository() = default;

  virtual Dialect Backend() const = 0;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // read-write scope
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // independent read scope (own connection) used for streaming cursors
  virtual std::unique_ptr<Transaction> BeginSnapshot() = 0;

  // ---------------------------------------------------------------------
  // Version ledger
  // ---------------------------------------------------------------------

  // Idempotent. Runs outside any caller transaction.
  virtual Result EnsureLedger() = 0;

  virtual Result Execute(Transaction&, const std::string& sql) = 0;

  virtual bool IsApplied(Transaction&, int64_t serial_number) = 0;

  virtual Result RecordApplied(Transaction&, int64_t serial_number) = 0;

  virtual std::optional<int64_t> MaxApplied(Transaction&) = 0;

  virtual std::vector<int64_t> ListApplied(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  virtual uint64_t CountEvents(Transaction&) = 0;

  // Streams events ordered by id, holding at most batch_size rows in memory.
  virtual Result ScanEvents(Transaction&, std::size_t batch_size, const EventVisitor& visit) = 0;

  virtual Result InsertEvent(Transaction&, const model::EventRecord&) = 0;

  // ---------------------------------------------------------------------
  // Tags
  // ---------------------------------------------------------------------

  virtual Result DeleteAllTags(Transaction&) = 0;

  // ON CONFLICT DO NOTHING: an existing identical row is not an error.
  virtual Result InsertTag(Transaction&, const model::TagRecord&) = 0;

  virtual std::vector<model::TagRecord> ListTags(Transaction&, const std::string& event_id) = 0;
};

} // namespace relaystore::db
