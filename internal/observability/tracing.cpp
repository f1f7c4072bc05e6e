#include "internal/observability/spans.hpp"

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>
#endif

namespace relaystore::observability {

using relaystore::runtime::config::OTLP_TRANSPORT_HTTP;

TracingOptions ResolveTracingOptions(const relaystore::runtime::config::ObservabilityConfig& config) {
  TracingOptions options;
  options.enabled = config.tracing_enabled();
  options.http    = config.transport() == OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    options.endpoint = config.otlp_endpoint();
  } else if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); env != nullptr && *env != '\0') {
    options.endpoint = env;
  } else {
    options.endpoint = options.http ? "http://localhost:4318/v1/traces" : "localhost:4317";
  }
  return options;
}

#ifdef ENABLE_OTEL

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const TracingOptions& options) {
  if (options.http) {
    otlp::OtlpHttpExporterOptions http;
    http.url = options.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(http);
  }
  otlp::OtlpGrpcExporterOptions grpc;
  grpc.endpoint            = options.endpoint;
  grpc.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(grpc);
}

} // namespace

bool InitializeTracing(const relaystore::runtime::config::ObservabilityConfig& config) {
  auto options = ResolveTracingOptions(config);
  if (!options.enabled) {
    return false;
  }

  auto processor = sdktrace::SimpleSpanProcessorFactory::Create(MakeExporter(options));
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", options.service_name}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attributes);

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(options.service_name);
  return true;
}

void ShutdownTracing() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_tracer = nullptr;
  g_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  if (g_tracer) {
    impl_ = std::make_unique<Impl>(g_tracer->StartSpan(std::string(name)));
  }
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

#else

struct SpanScope::Impl {};

bool InitializeTracing(const relaystore::runtime::config::ObservabilityConfig&) {
  return false;
}

void ShutdownTracing() {
}

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::RecordException(std::string_view) {
}

#endif

} // namespace relaystore::observability
