#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/schema_repository.hpp"
#include "internal/migration/migration_runner.hpp"
#include "internal/observability/progress.hpp"

namespace relaystore::factory {

/*
  Application

  Owns the long-lived objects used by the migrate tool.
*/
struct Application {
  std::shared_ptr<db::SchemaRepository>            repository;
  std::shared_ptr<observability::ProgressObserver> progress;
  std::unique_ptr<migration::MigrationRunner>      runner;
};

/*
  BuildRepository

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::SchemaRepository> BuildRepository(const relaystore::runtime::config::RuntimeConfig& config);

std::shared_ptr<observability::ProgressObserver> BuildProgress(const relaystore::runtime::config::RuntimeConfig& config);

// Build full application dependency graph
Application Build(const relaystore::runtime::config::RuntimeConfig& config);

} // namespace relaystore::factory
