#include "internal/migration/migration_runner.hpp"

#include <algorithm>
#include <string>

#include "internal/migration/registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relaystore::migration {

using observability::IntField;
using observability::StringField;

MigrationRunner::MigrationRunner(std::shared_ptr<db::SchemaRepository> repo, std::shared_ptr<observability::ProgressObserver> progress,
                                 std::size_t backfill_batch_size)
    : MigrationRunner(repo, Migrations(repo->Backend()), std::move(progress), backfill_batch_size) {
}

MigrationRunner::MigrationRunner(std::shared_ptr<db::SchemaRepository> repo, std::vector<MigrationDescriptor> migrations,
                                 std::shared_ptr<observability::ProgressObserver> progress, std::size_t backfill_batch_size)
    : repo_(std::move(repo)),
      migrations_(std::move(migrations)),
      progress_(progress ? std::move(progress) : std::make_shared<observability::NullProgress>()),
      backfill_batch_size_(backfill_batch_size) {
  ValidateRegistry(migrations_);
}

void MigrationRunner::EnsureLedger() {
  if (auto result = repo_->EnsureLedger(); !result) {
    throw util::DatabaseError("creating migrations table: " + result.ToString());
  }
}

int64_t MigrationRunner::Upgrade() {
  const char* dialect = db::DialectName(repo_->Backend());

  observability::SpanScope span(observability::kUpgradeSpan);
  span.SetAttribute("db.system", dialect);
  span.SetAttribute("latest_version", LatestVersion());

  EnsureLedger();

  for (const auto& migration : migrations_) {
    if (Apply(migration) != MigrationResult::kUpgraded) {
      continue;
    }
    if (auto backfill = migration.RequiredBackfill()) {
      RunBackfill(*backfill);
    }
  }

  auto version = CurrentVersion();
  span.SetAttribute("version", version);
  RELAYSTORE_LOG_INFO("database schema is current", {StringField("dialect", dialect), IntField("version", version)});
  return version;
}

MigrationResult MigrationRunner::Apply(const MigrationDescriptor& migration) {
  const auto serial = migration.serial_number;

  try {
    {
      auto check   = repo_->BeginSnapshot();
      bool applied = repo_->IsApplied(*check, serial);
      check->Rollback();
      if (applied) {
        return MigrationResult::kNotNeeded;
      }
    }

    observability::SpanScope span(observability::kApplySpan);
    span.SetAttribute("serial_number", serial);
    const auto start = util::Stopwatch::now();

    RELAYSTORE_LOG_INFO("applying migration", {IntField("serial_number", serial), StringField("description", migration.description)});

    auto    tx    = repo_->Begin();
    int64_t index = 0;
    for (const auto& statement : migration.Statements()) {
      RELAYSTORE_LOG_DEBUG("executing migration statement", {IntField("serial_number", serial), IntField("statement", index++)});
      if (auto executed = repo_->Execute(*tx, statement); !executed) {
        span.RecordException(executed.message);
        throw util::MigrationFailed(serial, executed.ToString());
      }
    }

    if (auto recorded = repo_->RecordApplied(*tx, serial); !recorded) {
      span.RecordException(recorded.message);
      throw util::MigrationFailed(serial, "recording version: " + recorded.ToString());
    }

    tx->Commit();

    RELAYSTORE_LOG_INFO("migration applied",
                        {IntField("serial_number", serial), observability::DurationField("elapsed", util::ElapsedMillis(start))});
    return MigrationResult::kUpgraded;
  } catch (const util::MigrationFailed&) {
    throw;
  } catch (const std::exception& e) {
    throw util::MigrationFailed(serial, e.what());
  }
}

BackfillStats MigrationRunner::RunBackfill(Backfill backfill) {
  RELAYSTORE_LOG_INFO("starting backfill", {StringField("backfill", BackfillName(backfill))});

  switch (backfill) {
    case Backfill::kRebuildTags:
      return TagRebuilder(repo_, progress_, backfill_batch_size_).Run();
  }
  throw util::BackfillFailed(std::string("unknown backfill ") + BackfillName(backfill));
}

int64_t MigrationRunner::CurrentVersion() {
  EnsureLedger();

  auto tx      = repo_->BeginSnapshot();
  auto version = repo_->MaxApplied(*tx);
  tx->Rollback();
  return version.value_or(0);
}

int64_t MigrationRunner::LatestVersion() const {
  return migration::LatestVersion(migrations_);
}

MigrationStatus MigrationRunner::Status() {
  MigrationStatus status;
  status.latest_version = LatestVersion();

  EnsureLedger();
  auto tx        = repo_->BeginSnapshot();
  status.applied = repo_->ListApplied(*tx);
  tx->Rollback();

  if (!status.applied.empty()) {
    status.current_version = status.applied.back();
  }

  for (const auto& migration : migrations_) {
    if (!std::binary_search(status.applied.begin(), status.applied.end(), migration.serial_number)) {
      status.pending.push_back(migration.serial_number);
    }
  }
  return status;
}

} // namespace relaystore::migration
