#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace relaystore::runtime::config {
class ObservabilityConfig;
}

namespace relaystore::observability {

// Spans emitted by relaystore-migrate.
inline constexpr std::string_view kUpgradeSpan     = "relaystore.migrate.upgrade";
inline constexpr std::string_view kApplySpan       = "relaystore.migrate.apply";
inline constexpr std::string_view kRebuildTagsSpan = "relaystore.migrate.rebuild_tags";

struct TracingOptions {
  bool        enabled = false;
  bool        http    = false; // OTLP/HTTP protobuf instead of OTLP/gRPC
  std::string endpoint;
  std::string service_name{"relaystore-migrate"};
};

/*
  Endpoint precedence: observability.otlp_endpoint, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the local collector default for the
  chosen transport.
*/
TracingOptions ResolveTracingOptions(const relaystore::runtime::config::ObservabilityConfig& config);

// false when tracing is disabled in config or compiled out.
bool InitializeTracing(const relaystore::runtime::config::ObservabilityConfig& config);

// Flushes pending spans. The tool is short-lived, so this runs before exit.
void ShutdownTracing();

/*
  RAII span, active for the current thread while alive.
  Every method is a no-op when no tracer is installed.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace relaystore::observability
