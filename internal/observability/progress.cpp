#include "internal/observability/progress.hpp"

#include "internal/observability/logging.hpp"

namespace relaystore::observability {

LogProgress::LogProgress(std::uint64_t interval) : interval_(interval == 0 ? kDefaultInterval : interval) {
}

void LogProgress::OnStart(std::string_view label, std::uint64_t total) {
  label_     = std::string(label);
  total_     = total;
  processed_ = 0;
  started_   = util::Stopwatch::now();
  Report("progress started");
}

void LogProgress::OnAdvance(std::uint64_t processed) {
  processed_ = processed;
  if (processed_ % interval_ == 0) {
    Report("progress");
  }
}

void LogProgress::OnFinish() {
  Report("progress finished");
}

void LogProgress::Report(std::string_view message) const {
  std::int64_t percent = total_ == 0 ? 100 : static_cast<std::int64_t>(processed_ * 100 / total_);
  LogInfo(message,
          {StringField("task", label_), IntField("processed", static_cast<std::int64_t>(processed_)),
           IntField("total", static_cast<std::int64_t>(total_)), IntField("percent", percent),
           DurationField("elapsed", util::ElapsedMillis(started_))});
}

} // namespace relaystore::observability
