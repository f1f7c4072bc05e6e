#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/schema_repository.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/tag_record.hpp"
#include "internal/migration/migration_runner.hpp"
#include "internal/migration/registry.hpp"
#include "internal/observability/progress.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

#if RELAYSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema_repository.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#endif

#if RELAYSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_schema_repository.hpp"
#endif

namespace {

using relaystore::db::SchemaRepository;
using relaystore::db::model::EventRecord;
using relaystore::db::model::TagRecord;
using relaystore::migration::Backfill;
using relaystore::migration::MigrationDescriptor;
using relaystore::migration::MigrationRunner;
using relaystore::migration::Migrations;
using relaystore::migration::SqlMigration;
using relaystore::observability::ProgressObserver;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<SchemaRepository>()> make_repository; // empty database per call
  std::function<void()>                             cleanup;
};

class RecordingProgress final : public ProgressObserver {
 public:
  void OnStart(std::string_view label, std::uint64_t total) override {
    ++starts;
    last_label = std::string(label);
    last_total = total;
  }
  void OnAdvance(std::uint64_t processed) override {
    last_processed = processed;
  }
  void OnFinish() override {
    ++finishes;
  }

  int           starts   = 0;
  int           finishes = 0;
  std::string   last_label;
  std::uint64_t last_total     = 0;
  std::uint64_t last_processed = 0;
};

std::string EventId(char fill) {
  return std::string(32, fill);
}

EventRecord MakeEvent(char fill, const std::string& content) {
  EventRecord event;
  event.id         = EventId(fill);
  event.pub_key    = std::string(32, '\x7f');
  event.created_at = 1700000000;
  event.kind       = 1;
  event.content    = content;
  return event;
}

void InsertEvents(SchemaRepository& repo, const std::vector<EventRecord>& events) {
  auto tx = repo.Begin();
  for (const auto& event : events) {
    auto inserted = repo.InsertEvent(*tx, event);
    assert(inserted);
  }
  tx->Commit();
}

std::vector<TagRecord> ReadTags(SchemaRepository& repo, const std::string& event_id) {
  auto tx   = repo.BeginSnapshot();
  auto tags = repo.ListTags(*tx, event_id);
  tx->Rollback();
  return tags;
}

const TagRecord* FindTag(const std::vector<TagRecord>& tags, const std::string& name) {
  for (const auto& tag : tags) {
    if (tag.name == name) return &tag;
  }
  return nullptr;
}

std::vector<MigrationDescriptor> CatalogPrefix(SchemaRepository& repo, std::size_t count) {
  const auto& full = Migrations(repo.Backend());
  return std::vector<MigrationDescriptor>(full.begin(), full.begin() + count);
}

void VerifyFreshUpgradeIsIdempotent(const std::shared_ptr<SchemaRepository>& repo) {
  auto            progress = std::make_shared<RecordingProgress>();
  MigrationRunner runner(repo, progress);

  auto before = runner.Status();
  assert(before.current_version == 0);
  assert(before.latest_version == 4);
  assert(before.applied.empty());
  assert(before.pending == std::vector<int64_t>({1, 2, 3, 4}));

  assert(runner.Upgrade() == 4);
  assert(runner.CurrentVersion() == 4);

  // the tag rebuild ran once, over an empty event table
  assert(progress->starts == 1);
  assert(progress->finishes == 1);
  assert(progress->last_total == 0);

  auto after = runner.Status();
  assert(after.current_version == 4);
  assert(after.applied == std::vector<int64_t>({1, 2, 3, 4}));
  assert(after.pending.empty());

  // second start: nothing runs, not even the backfill
  assert(runner.Upgrade() == 4);
  assert(progress->starts == 1);
  assert(runner.Status().applied == after.applied);

  // the ledger persists across a fresh runner
  MigrationRunner restarted(repo, nullptr);
  assert(restarted.CurrentVersion() == 4);
  assert(restarted.Upgrade() == 4);
}

void VerifyCurrentVersionOnFreshDatabase(const std::shared_ptr<SchemaRepository>& repo) {
  MigrationRunner runner(repo, nullptr);
  assert(runner.CurrentVersion() == 0);
  assert(runner.CurrentVersion() == 0);
  assert(runner.Status().pending.size() == 4);
}

void VerifyPendingMigrationsRunInOrder(const std::shared_ptr<SchemaRepository>& repo) {
  // 2 and 4 only succeed if 1 and 3 are skipped and 2 runs before 4
  std::vector<MigrationDescriptor> catalog = {
      {1, "seeded one", SqlMigration{{"CREATE TABLE seeded_one (id INTEGER);"}}},
      {2, "applied two", SqlMigration{{"CREATE TABLE applied_two (id INTEGER);"}}},
      {3, "seeded three", SqlMigration{{"CREATE TABLE seeded_three (id INTEGER);"}}},
      {4, "applied four",
       SqlMigration{{
           "INSERT INTO applied_two (id) VALUES (4);",
           "CREATE TABLE seeded_one (id INTEGER);",
           "CREATE TABLE seeded_three (id INTEGER);",
       }}},
  };

  MigrationRunner runner(repo, catalog, nullptr);
  runner.EnsureLedger();
  {
    auto tx = repo->Begin();
    assert(repo->RecordApplied(*tx, 1));
    assert(repo->RecordApplied(*tx, 3));
    tx->Commit();
  }

  auto status = runner.Status();
  assert(status.current_version == 3);
  assert(status.pending == std::vector<int64_t>({2, 4}));

  assert(runner.Upgrade() == 4);
  assert(runner.Status().applied == std::vector<int64_t>({1, 2, 3, 4}));
}

void VerifyFailedMigrationLeavesNoTrace(const std::shared_ptr<SchemaRepository>& repo) {
  std::vector<MigrationDescriptor> catalog = {
      {1, "good", SqlMigration{{"CREATE TABLE atomic_ok (id INTEGER);"}}},
      {2, "half broken", SqlMigration{{"CREATE TABLE atomic_half (id INTEGER);", "THIS IS NOT SQL;"}}},
      {3, "never reached", SqlMigration{{"CREATE TABLE atomic_later (id INTEGER);"}}},
  };

  MigrationRunner runner(repo, catalog, nullptr);

  bool failed = false;
  try {
    runner.Upgrade();
  } catch (const relaystore::util::MigrationFailed& e) {
    failed = true;
    assert(e.serial_number() == 2);
  }
  assert(failed && "a failing statement must abort the upgrade");

  auto status = runner.Status();
  assert(status.applied == std::vector<int64_t>({1}));
  assert(status.pending == std::vector<int64_t>({2, 3}));

  // atomic_half was rolled back along with the ledger row, so a fixed 2 can create it
  std::vector<MigrationDescriptor> fixed = {
      catalog[0],
      {2, "fixed", SqlMigration{{"CREATE TABLE atomic_half (id INTEGER);"}}},
      catalog[2],
  };
  MigrationRunner retry(repo, fixed, nullptr);
  assert(retry.Upgrade() == 3);
}

void VerifyUpgradeRebuildsTags(const std::shared_ptr<SchemaRepository>& repo) {
  MigrationRunner initial(repo, CatalogPrefix(*repo, 1), nullptr);
  assert(initial.Upgrade() == 1);

  InsertEvents(*repo, {
                          MakeEvent('\x02', R"({"kind":1,"tags":[["e","abc123"],["p","NotHex"],["x"],["e","abc123"],["nonce","1","20"]]})"),
                          MakeEvent('\x03', R"({"kind":1,"tags":[["t","DeadBeef"],["d",""]]})"),
                      });

  // stale pre-packing row that the rebuild must replace
  {
    auto tx = repo->Begin();
    assert(repo->Execute(*tx, "INSERT INTO tag (event_id, name, value) SELECT id, 'z', id FROM event;"));
    tx->Commit();
  }

  auto            progress = std::make_shared<RecordingProgress>();
  MigrationRunner runner(repo, progress, 1);
  assert(runner.Upgrade() == 4);

  assert(progress->starts == 1);
  assert(progress->last_total == 2);
  assert(progress->last_processed == 2);

  auto first = ReadTags(*repo, EventId('\x02'));
  assert(first.size() == 2);
  assert(FindTag(first, "z") == nullptr);

  auto* e = FindTag(first, "e");
  assert(e != nullptr);
  assert(!e->value.has_value());
  assert(e->value_hex == relaystore::util::HexDecode("abc123"));

  auto* p = FindTag(first, "p");
  assert(p != nullptr);
  assert(p->value == std::optional<std::string>("NotHex"));
  assert(!p->value_hex.has_value());

  auto second = ReadTags(*repo, EventId('\x03'));
  assert(second.size() == 2);
  auto* t = FindTag(second, "t");
  assert(t != nullptr && t->value == std::optional<std::string>("DeadBeef"));
  auto* d = FindTag(second, "d");
  assert(d != nullptr && d->value_hex.has_value() && d->value_hex->empty());
}

void VerifyRebuildIsRepeatable(const std::shared_ptr<SchemaRepository>& repo) {
  MigrationRunner runner(repo, nullptr, 2);
  assert(runner.Upgrade() == 4);

  std::vector<EventRecord> events;
  for (char fill = '\x10'; fill < '\x15'; ++fill) {
    events.push_back(MakeEvent(fill, R"({"tags":[["e","00ff"],["p","relay"]]})"));
  }
  InsertEvents(*repo, events);

  auto stats = runner.RunBackfill(Backfill::kRebuildTags);
  assert(stats.events_scanned == 5);
  assert(stats.tags_indexed == 10);
  assert(stats.tags_discarded == 0);

  auto again = runner.RunBackfill(Backfill::kRebuildTags);
  assert(again.events_scanned == 5);
  assert(ReadTags(*repo, EventId('\x12')).size() == 2);
}

void VerifyMalformedEventAbortsBackfill(const std::shared_ptr<SchemaRepository>& repo) {
  MigrationRunner runner(repo, nullptr);
  assert(runner.Upgrade() == 4);

  InsertEvents(*repo, {
                          MakeEvent('\x20', R"({"tags":[["e","beef"]]})"),
                          MakeEvent('\x21', "not json at all"),
                      });
  {
    auto      tx = repo->Begin();
    TagRecord old;
    old.event_id = EventId('\x20');
    old.name     = "q";
    old.value    = "old";
    assert(repo->InsertTag(*tx, old));
    tx->Commit();
  }

  bool failed = false;
  try {
    runner.RunBackfill(Backfill::kRebuildTags);
  } catch (const relaystore::util::BackfillFailed&) {
    failed = true;
  }
  assert(failed && "unparseable content must abort the rebuild");

  // the write scope rolled back: previous tags untouched
  auto tags = ReadTags(*repo, EventId('\x20'));
  assert(tags.size() == 1);
  assert(tags[0].name == "q");
  assert(tags[0].value == std::optional<std::string>("old"));

  assert(runner.CurrentVersion() == 4);
}

void VerifyBackfillFailureInsideUpgrade(const std::shared_ptr<SchemaRepository>& repo) {
  MigrationRunner initial(repo, CatalogPrefix(*repo, 1), nullptr);
  assert(initial.Upgrade() == 1);

  InsertEvents(*repo, {MakeEvent('\x30', R"({"tags":[["e",1]]})")});

  MigrationRunner runner(repo, nullptr);
  bool            failed = false;
  try {
    runner.Upgrade();
  } catch (const relaystore::util::BackfillFailed&) {
    failed = true;
  }
  assert(failed && "a malformed event must surface from Upgrade");

  // m2 committed before its backfill ran; nothing after it was attempted
  auto status = runner.Status();
  assert(status.applied == std::vector<int64_t>({1, 2}));
  assert(status.pending == std::vector<int64_t>({3, 4}));

  // the ledger already holds 2, so the next start finishes 3 and 4 without a rebuild
  auto            progress = std::make_shared<RecordingProgress>();
  MigrationRunner restarted(repo, progress);
  assert(restarted.Upgrade() == 4);
  assert(progress->starts == 0);
  assert(ReadTags(*repo, EventId('\x30')).empty());

  // operator recovery: fix the data, then rebuild explicitly
  {
    auto tx = repo->Begin();
    assert(repo->Execute(*tx, "DELETE FROM event;"));
    tx->Commit();
  }
  InsertEvents(*repo, {MakeEvent('\x31', R"({"tags":[["e","0a0b"],["t","relay"]]})")});

  auto stats = restarted.RunBackfill(Backfill::kRebuildTags);
  assert(stats.events_scanned == 1);
  assert(stats.tags_indexed == 2);
  assert(ReadTags(*repo, EventId('\x31')).size() == 2);
}

void VerifyTagsCascadeWithEvent(const std::shared_ptr<SchemaRepository>& repo) {
  MigrationRunner runner(repo, nullptr);
  assert(runner.Upgrade() == 4);

  InsertEvents(*repo, {
                          MakeEvent('\x40', R"({"tags":[["e","ff"],["p","someone"]]})"),
                          MakeEvent('\x41', R"({"tags":[["t","kept"]]})"),
                      });
  auto stats = runner.RunBackfill(Backfill::kRebuildTags);
  assert(stats.tags_indexed == 3);
  assert(ReadTags(*repo, EventId('\x40')).size() == 2);

  {
    auto tx = repo->Begin();
    assert(repo->Execute(*tx, "DELETE FROM event WHERE id IN (SELECT event_id FROM tag WHERE name = 'p');"));
    tx->Commit();
  }

  assert(ReadTags(*repo, EventId('\x40')).empty());
  assert(ReadTags(*repo, EventId('\x41')).size() == 1);

  auto tx = repo->BeginSnapshot();
  assert(repo->CountEvents(*tx) == 1);
  tx->Rollback();
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  VerifyFreshUpgradeIsIdempotent(backend.make_repository());
  VerifyCurrentVersionOnFreshDatabase(backend.make_repository());
  VerifyPendingMigrationsRunInOrder(backend.make_repository());
  VerifyFailedMigrationLeavesNoTrace(backend.make_repository());
  VerifyUpgradeRebuildsTags(backend.make_repository());
  VerifyRebuildIsRepeatable(backend.make_repository());
  VerifyMalformedEventAbortsBackfill(backend.make_repository());
  VerifyBackfillFailureInsideUpgrade(backend.make_repository());
  VerifyTagsCascadeWithEvent(backend.make_repository());

  backend.cleanup();
}

#if RELAYSTORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto base  = std::filesystem::temp_directory_path() / ("relaystore_integration_sqlite_" + std::to_string(NowMs()));
  auto count = std::make_shared<int>(0);
  std::filesystem::create_directories(base);

  auto make_repo = [base, count]() -> std::shared_ptr<SchemaRepository> {
    auto path = (base / ("case_" + std::to_string(++*count) + ".db")).string();
    auto db   = std::make_shared<relaystore::db::sqlite::SqliteDB>(path);
    return std::make_shared<relaystore::db::sqlite::SqliteSchemaRepository>(std::move(db));
  };

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = make_repo,
      .cleanup         = [base]() { std::filesystem::remove_all(base); },
  };
}

// The snapshot reader is a second connection; it must wait on locks as long as the writer does.
void VerifySnapshotConnectionKeepsBusyTimeout() {
  auto base = std::filesystem::temp_directory_path() / ("relaystore_integration_busy_" + std::to_string(NowMs()));
  std::filesystem::create_directories(base);

  {
    auto db   = std::make_shared<relaystore::db::sqlite::SqliteDB>((base / "busy.db").string(), 1234);
    auto repo = std::make_shared<relaystore::db::sqlite::SqliteSchemaRepository>(db);

    auto  snapshot = repo->BeginSnapshot();
    auto& reader   = static_cast<relaystore::db::sqlite::SqliteTransaction&>(*snapshot);
    auto  stmt     = reader.DB().Prepare("PRAGMA busy_timeout;");
    assert(sqlite3_step(stmt.get()) == SQLITE_ROW);
    assert(sqlite3_column_int(stmt.get(), 0) == 1234);
    stmt.reset();
    snapshot->Rollback();
  }

  std::filesystem::remove_all(base);
}
#endif

#if RELAYSTORE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RELAYSTORE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RELAYSTORE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<SchemaRepository> {
    auto       pool = std::make_shared<relaystore::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      tx.exec(
          "DROP TABLE IF EXISTS invoice, account, user_verification, tag, event, migrations, seeded_one, seeded_three, applied_two, "
          "atomic_ok, atomic_half, atomic_later CASCADE;");
      tx.exec("DROP TYPE IF EXISTS status;");
      tx.commit();
    }
    return std::make_shared<relaystore::db::postgres::PgSchemaRepository>(std::move(pool));
  };

  return BackendFactory{
      .name            = "postgres",
      .make_repository = make_repo,
      .cleanup         = []() {},
  };
}
#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;

#if RELAYSTORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RELAYSTORE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if RELAYSTORE_DB_SQLITE
  VerifySnapshotConnectionKeepsBusyTimeout();
#endif

  std::cout << "relaystore_integration_migration_parity: pass\n";
  return 0;
}
