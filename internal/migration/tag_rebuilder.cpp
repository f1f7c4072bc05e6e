#include "internal/migration/tag_rebuilder.hpp"

#include <string>
#include <vector>

#include "internal/event/event_content.hpp"
#include "internal/event/tag.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

namespace relaystore::migration {

using db::ErrorCode;
using db::Result;
using observability::IntField;

TagRebuilder::TagRebuilder(std::shared_ptr<db::SchemaRepository> repo, std::shared_ptr<observability::ProgressObserver> progress,
                           std::size_t batch_size)
    : repo_(std::move(repo)),
      progress_(progress ? std::move(progress) : std::make_shared<observability::NullProgress>()),
      batch_size_(batch_size == 0 ? kDefaultBatchSize : batch_size) {
}

BackfillStats TagRebuilder::Run() {
  observability::SpanScope span(observability::kRebuildTagsSpan);
  const auto               start = util::Stopwatch::now();
  BackfillStats            stats;

  try {
    auto read_tx  = repo_->BeginSnapshot();
    auto write_tx = repo_->Begin();

    // full replacement, not a merge: the value encoding rule changed
    if (auto cleared = repo_->DeleteAllTags(*write_tx); !cleared) {
      throw util::BackfillFailed("clearing tag table: " + cleared.ToString());
    }

    const auto total = repo_->CountEvents(*read_tx);
    progress_->OnStart("rebuilding tags table", total);

    auto scanned = repo_->ScanEvents(*read_tx, batch_size_, [&](const db::model::EventRecord& e) -> Result {
      progress_->OnAdvance(++stats.events_scanned);

      std::vector<event::TagEntry> tags;
      try {
        tags = event::ParseTags(e.content);
      } catch (const util::MalformedEvent& ex) {
        return Result::Err(ErrorCode::Corruption, "event " + util::HexEncode(e.id) + ": " + ex.what());
      }

      auto indexed = event::IndexTags(e.id, tags);
      stats.tags_discarded += indexed.discarded;

      for (const auto& tag : indexed.rows) {
        if (auto inserted = repo_->InsertTag(*write_tx, tag); !inserted) {
          return inserted;
        }
        ++stats.tags_indexed;
      }
      return Result::Ok();
    });

    if (!scanned) {
      throw util::BackfillFailed(scanned.ToString());
    }

    write_tx->Commit();
    read_tx->Rollback();
  } catch (const util::BackfillFailed& e) {
    span.RecordException(e.what());
    throw;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::BackfillFailed(e.what());
  }

  progress_->OnFinish();
  stats.duration_ms = util::ElapsedMillis(start);

  span.SetAttribute("events_scanned", static_cast<std::int64_t>(stats.events_scanned));
  RELAYSTORE_LOG_INFO("rebuilt tags",
                      {IntField("events", static_cast<std::int64_t>(stats.events_scanned)),
                       IntField("tags", static_cast<std::int64_t>(stats.tags_indexed)),
                       IntField("discarded", static_cast<std::int64_t>(stats.tags_discarded)),
                       observability::DurationField("elapsed", stats.duration_ms)});
  return stats;
}

} // namespace relaystore::migration
