#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#if RELAYSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema_repository.hpp"
#endif
#if RELAYSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_schema_repository.hpp"
#endif

namespace relaystore::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::SchemaRepository> BuildRepository(const relaystore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELAYSTORE_DB_SQLITE
    const auto& sqlite  = database.sqlite();
    auto        timeout = sqlite.busy_timeout_ms() == 0 ? db::sqlite::SqliteDB::kDefaultBusyTimeoutMs : sqlite.busy_timeout_ms();
    RELAYSTORE_LOG_INFO("opening sqlite database", {StringField("path", sqlite.path()), IntField("busy_timeout_ms", timeout)});
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), timeout);
    return std::make_shared<db::sqlite::SqliteSchemaRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELAYSTORE_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        max_conn = postgres.max_connections() == 0 ? db::postgres::PgPool::kDefaultMaxConnections : postgres.max_connections();
    RELAYSTORE_LOG_INFO("connecting to postgres", {IntField("max_connections", static_cast<int64_t>(max_conn))});
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_conn);
    return std::make_shared<db::postgres::PgSchemaRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("no database backend configured");
}

std::shared_ptr<observability::ProgressObserver> BuildProgress(const relaystore::runtime::config::RuntimeConfig& config) {
  const auto& migrations = config.migrations();
  if (!migrations.progress_enabled()) {
    return std::make_shared<observability::NullProgress>();
  }
  return std::make_shared<observability::LogProgress>(migrations.progress_interval());
}

Application Build(const relaystore::runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);
  app.progress   = BuildProgress(config);

  const auto& migrations = config.migrations();
  app.runner = std::make_unique<migration::MigrationRunner>(app.repository, app.progress, migrations.backfill_batch_size());

  RELAYSTORE_LOG_INFO("migration runner ready",
                      {StringField("dialect", db::DialectName(app.repository->Backend())),
                       IntField("latest_version", app.runner->LatestVersion()),
                       IntField("backfill_batch_size", migrations.backfill_batch_size())});

  return app;
}

} // namespace relaystore::factory
