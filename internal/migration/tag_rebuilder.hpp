#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "internal/db/api/schema_repository.hpp"
#include "internal/observability/progress.hpp"

namespace relaystore::migration {

struct BackfillStats {
  uint64_t events_scanned = 0;
  uint64_t tags_indexed   = 0; // rows submitted; duplicates are dropped by the insert
  uint64_t tags_discarded = 0; // too short or unindexable name
  int64_t  duration_ms    = 0;
};

/*
  Regenerates every tag row from the event table.

  Two independent scopes:
    read   snapshot streaming events ordered by id, batch_size rows at a time
    write  DELETE FROM tag, then one conflict-tolerant insert per tag

  The write scope commits only after the whole table was processed. Any
  parse or database failure rolls it back and throws util::BackfillFailed.
*/
class TagRebuilder {
 public:
  static constexpr std::size_t kDefaultBatchSize = 1000;

  TagRebuilder(std::shared_ptr<db::SchemaRepository> repo, std::shared_ptr<observability::ProgressObserver> progress,
               std::size_t batch_size = kDefaultBatchSize);

  BackfillStats Run();

 private:
  std::shared_ptr<db::SchemaRepository>            repo_;
  std::shared_ptr<observability::ProgressObserver> progress_;
  std::size_t                                      batch_size_;
};

} // namespace relaystore::migration
