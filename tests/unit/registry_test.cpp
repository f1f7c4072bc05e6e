#include "internal/migration/registry.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

using relaystore::db::Dialect;
using relaystore::migration::Backfill;
using relaystore::migration::DataTransformMigration;
using relaystore::migration::LatestVersion;
using relaystore::migration::MigrationDescriptor;
using relaystore::migration::Migrations;
using relaystore::migration::SqlMigration;
using relaystore::migration::ValidateRegistry;

bool Rejects(const std::vector<MigrationDescriptor>& migrations) {
  try {
    ValidateRegistry(migrations);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void VerifyCatalog(Dialect dialect) {
  const auto& catalog = Migrations(dialect);
  assert(catalog.size() == 4);
  for (std::size_t i = 0; i < catalog.size(); ++i) {
    assert(catalog[i].serial_number == static_cast<int64_t>(i + 1));
    assert(!catalog[i].Statements().empty());
    assert(!catalog[i].description.empty());
  }
  assert(LatestVersion(catalog) == 4);

  // only the hex-packing migration needs a data rewrite
  assert(!catalog[0].RequiredBackfill().has_value());
  assert(catalog[1].RequiredBackfill() == Backfill::kRebuildTags);
  assert(!catalog[2].RequiredBackfill().has_value());
  assert(!catalog[3].RequiredBackfill().has_value());
}

void TestValidation() {
  assert(!Rejects({}));
  assert(!Rejects({{1, "a", SqlMigration{{"SELECT 1;"}}}, {5, "b", SqlMigration{{"SELECT 1;"}}}}));

  assert(Rejects({{0, "zero", SqlMigration{{"SELECT 1;"}}}}));
  assert(Rejects({{-1, "negative", SqlMigration{{"SELECT 1;"}}}}));
  assert(Rejects({{2, "b", SqlMigration{{"SELECT 1;"}}}, {1, "a", SqlMigration{{"SELECT 1;"}}}}));
  assert(Rejects({{1, "a", SqlMigration{{"SELECT 1;"}}}, {1, "dup", SqlMigration{{"SELECT 1;"}}}}));
  assert(Rejects({{1, "empty", DataTransformMigration{{}, Backfill::kRebuildTags}}}));
}

void TestLatestVersionOfEmptyCatalog() {
  assert(LatestVersion({}) == 0);
}

} // namespace

int main() {
  VerifyCatalog(Dialect::kPostgres);
  VerifyCatalog(Dialect::kSqlite);
  TestValidation();
  TestLatestVersionOfEmptyCatalog();

  std::cout << "relaystore_unit_registry: pass\n";
  return 0;
}
