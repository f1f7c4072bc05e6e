#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace relaystore::observability {

/*
  Operator-facing progress side channel for long scans.

  Observers must never influence control flow: the caller ignores them
  for correctness and may pass NullProgress.
*/
class ProgressObserver {
 public:
  virtual ~ProgressObserver() = default;

  virtual void OnStart(std::string_view label, std::uint64_t total) = 0;
  virtual void OnAdvance(std::uint64_t processed)                     = 0;
  virtual void OnFinish()                                             = 0;
};

class NullProgress final : public ProgressObserver {
 public:
  void OnStart(std::string_view, std::uint64_t) override {
  }
  void OnAdvance(std::uint64_t) override {
  }
  void OnFinish() override {
  }
};

// Logs one line every `interval` processed units and one on completion.
class LogProgress final : public ProgressObserver {
 public:
  static constexpr std::uint64_t kDefaultInterval = 10000;

  explicit LogProgress(std::uint64_t interval = kDefaultInterval);

  void OnStart(std::string_view label, std::uint64_t total) override;
  void OnAdvance(std::uint64_t processed) override;
  void OnFinish() override;

 private:
  void Report(std::string_view message) const;

  std::uint64_t                 interval_;
  std::string                   label_;
  std::uint64_t                 total_     = 0;
  std::uint64_t                 processed_ = 0;
  util::Stopwatch::time_point   started_{};
};

} // namespace relaystore::observability
