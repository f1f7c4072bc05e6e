#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/schema_repository.hpp"
#include "internal/migration/descriptor.hpp"
#include "internal/migration/tag_rebuilder.hpp"
#include "internal/observability/progress.hpp"

namespace relaystore::migration {

// Running a migration was either unnecessary, or completed.
enum class MigrationResult {
  kUpgraded,
  kNotNeeded,
};

struct MigrationStatus {
  int64_t              current_version = 0;
  int64_t              latest_version  = 0;
  std::vector<int64_t> applied;
  std::vector<int64_t> pending;
};

/*
  MigrationRunner

  Brings the database up to the newest compiled-in schema at startup.

  - one ledger check (own read scope) per descriptor, no cached state
  - one transaction per pending descriptor: statements + ledger insert + commit
  - a descriptor's backfill runs after its commit, before the next descriptor
  - the first failure throws util::MigrationFailed / util::BackfillFailed and
    nothing later is attempted

  Single-process: concurrent upgraders are only kept apart by the primary
  key on the ledger, which makes the slower racer's transaction fail.
*/
class MigrationRunner {
 public:
  // Uses the catalog for repo->Backend().
  MigrationRunner(std::shared_ptr<db::SchemaRepository> repo, std::shared_ptr<observability::ProgressObserver> progress,
                  std::size_t backfill_batch_size = TagRebuilder::kDefaultBatchSize);

  // Custom catalog; validated on construction.
  MigrationRunner(std::shared_ptr<db::SchemaRepository> repo, std::vector<MigrationDescriptor> migrations,
                  std::shared_ptr<observability::ProgressObserver> progress,
                  std::size_t backfill_batch_size = TagRebuilder::kDefaultBatchSize);

  // Creates the version ledger if absent. Safe on every startup.
  void EnsureLedger();

  // Applies every pending migration in ascending order; returns the current version.
  int64_t Upgrade();

  MigrationResult Apply(const MigrationDescriptor& migration);

  BackfillStats RunBackfill(Backfill backfill);

  // Highest applied serial number, 0 for an empty ledger. Creates the ledger if absent.
  int64_t CurrentVersion();

  int64_t LatestVersion() const;

  // Applied and pending serials. Creates the ledger if absent.
  MigrationStatus Status();

  const std::vector<MigrationDescriptor>& Catalog() const {
    return migrations_;
  }

 private:
  std::shared_ptr<db::SchemaRepository>            repo_;
  std::vector<MigrationDescriptor>                 migrations_;
  std::shared_ptr<observability::ProgressObserver> progress_;
  std::size_t                                      backfill_batch_size_;
};

} // namespace relaystore::migration
