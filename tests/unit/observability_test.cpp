#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

using relaystore::observability::DurationField;
using relaystore::observability::FormatLogLine;
using relaystore::observability::IntField;
using relaystore::observability::ResolveLoggingOptions;
using relaystore::observability::ResolveTracingOptions;
using relaystore::observability::StringField;
using relaystore::runtime::config::LoggingConfig;
using relaystore::runtime::config::ObservabilityConfig;

void ClearEnvironment() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("RELAYSTORE_LOG_LEVEL");
  unsetenv("RELAYSTORE_LOG_PATTERN");
  unsetenv("RELAYSTORE_LOG_INCLUDE_TRACE_CONTEXT");
}

void TestTracingEndpointPrecedence() {
  ClearEnvironment();

  ObservabilityConfig config;
  auto                grpc = ResolveTracingOptions(config);
  assert(!grpc.enabled);
  assert(!grpc.http);
  assert(grpc.endpoint == "localhost:4317");
  assert(grpc.service_name == "relaystore-migrate");

  config.set_transport(relaystore::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(ResolveTracingOptions(config).endpoint == "http://localhost:4318/v1/traces");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318/v1/traces", 1);
  assert(ResolveTracingOptions(config).endpoint == "http://collector:4318/v1/traces");

  config.set_tracing_enabled(true);
  config.set_otlp_endpoint("http://tracing.internal:4318/v1/traces");
  auto configured = ResolveTracingOptions(config);
  assert(configured.enabled);
  assert(configured.http);
  assert(configured.endpoint == "http://tracing.internal:4318/v1/traces");

  ClearEnvironment();
}

void TestDisabledTracingIsNoOp() {
  ObservabilityConfig config;
  assert(!relaystore::observability::InitializeTracing(config));

  relaystore::observability::SpanScope span(relaystore::observability::kUpgradeSpan);
  span.SetAttribute("db.system", "sqlite");
  span.SetAttribute("version", int64_t{4});
  span.RecordException("nothing is exported");
  relaystore::observability::ShutdownTracing();
}

void TestLoggingOptions() {
  ClearEnvironment();

  LoggingConfig config;
  auto          defaults = ResolveLoggingOptions(config);
  assert(defaults.level == spdlog::level::info);
  assert(!defaults.include_trace_context);

  config.set_level("debug");
  config.set_pattern("%v");
  config.set_include_trace_context(true);
  auto configured = ResolveLoggingOptions(config);
  assert(configured.level == spdlog::level::debug);
  assert(configured.pattern == "%v");
  assert(configured.include_trace_context);

  setenv("RELAYSTORE_LOG_LEVEL", "warning", 1);
  setenv("RELAYSTORE_LOG_INCLUDE_TRACE_CONTEXT", "false", 1);
  auto overridden = ResolveLoggingOptions(config);
  assert(overridden.level == spdlog::level::warn);
  assert(!overridden.include_trace_context);

  ClearEnvironment();
}

void TestUnknownLogLevelIsRejected() {
  ClearEnvironment();

  LoggingConfig config;
  config.set_level("chatty");

  bool rejected = false;
  try {
    (void)ResolveLoggingOptions(config);
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);

  config.set_level("off");
  assert(ResolveLoggingOptions(config).level == spdlog::level::off);
}

void TestFormatLogLine() {
  assert(FormatLogLine("schema is current", {}) == "schema is current");
  assert(FormatLogLine("migration applied", {IntField("serial_number", 3), DurationField("elapsed", 12)}) ==
         "migration applied serial_number=3 elapsed=12ms");
  assert(FormatLogLine("applying migration", {StringField("description", "add tag unique constraint")}) ==
         "applying migration description=\"add tag unique constraint\"");
  assert(FormatLogLine("fatal", {StringField("error", "near \"THIS\": syntax error")}) == "fatal error=\"near \\\"THIS\\\": syntax error\"");
  assert(FormatLogLine("opening sqlite database", {StringField("path", "")}) == "opening sqlite database path=\"\"");
}

} // namespace

int main() {
  TestTracingEndpointPrecedence();
  TestDisabledTracingIsNoOp();
  TestLoggingOptions();
  TestUnknownLogLevelIsRejected();
  TestFormatLogLine();

  std::cout << "relaystore_unit_observability: pass\n";
  return 0;
}
