#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/schema_repository.hpp"
#include "internal/migration/descriptor.hpp"

namespace relaystore::migration {

/*
  Compiled-in migration catalog.

  One catalog per SQL dialect. Both carry the same serial numbers with
  equivalent effect. New migrations are appended with the next serial
  number; shipped entries are never edited or reordered.
*/
const std::vector<MigrationDescriptor>& Migrations(db::Dialect dialect);

// Throws std::invalid_argument unless serial numbers are positive and strictly increasing.
void ValidateRegistry(const std::vector<MigrationDescriptor>& migrations);

// Highest serial number in the catalog, 0 when empty.
int64_t LatestVersion(const std::vector<MigrationDescriptor>& migrations);

} // namespace relaystore::migration
