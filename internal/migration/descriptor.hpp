#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relaystore::migration {

// Post-commit data procedures a migration can request. Closed set.
enum class Backfill {
  kRebuildTags,
};

const char* BackfillName(Backfill backfill);

// Schema statements only.
struct SqlMigration {
  std::vector<std::string> statements;
};

// Schema statements, then a data rewrite once they have committed.
struct DataTransformMigration {
  std::vector<std::string> statements;
  Backfill                 backfill;
};

using MigrationBody = std::variant<SqlMigration, DataTransformMigration>;

/*
  One versioned unit of schema change.

  Immutable once shipped: deployments that already applied a serial number
  never see it again, so changing its statements forks the schema history.
*/
struct MigrationDescriptor {
  int64_t       serial_number = 0;
  std::string   description;
  MigrationBody body;

  // executed in order inside one transaction
  const std::vector<std::string>& Statements() const;

  std::optional<Backfill> RequiredBackfill() const;
};

} // namespace relaystore::migration
