#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>

#include "internal/util/hex.hpp"
#endif

namespace relaystore::observability {
namespace {

constexpr const char* kLoggerName = "relaystore";

std::atomic<bool> g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string TraceContext() {
  auto span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  auto as_view = [](const uint8_t* data, std::size_t size) { return std::string_view(reinterpret_cast<const char*>(data), size); };
  return "trace_id=" + util::HexEncode(as_view(trace_bytes, 16)) + " span_id=" + util::HexEncode(as_view(span_bytes, 8));
}
#else
std::string TraceContext() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DurationField(std::string_view key, std::int64_t millis) {
  return {std::string(key), std::to_string(millis) + "ms"};
}

LoggingOptions ResolveLoggingOptions(const relaystore::runtime::config::LoggingConfig& config) {
  LoggingOptions options;

  if (const char* level = Env("RELAYSTORE_LOG_LEVEL")) {
    options.level = ParseLevel(level);
  } else if (!config.level().empty()) {
    options.level = ParseLevel(config.level());
  }

  if (const char* pattern = Env("RELAYSTORE_LOG_PATTERN")) {
    options.pattern = pattern;
  } else if (!config.pattern().empty()) {
    options.pattern = config.pattern();
  }

  if (const char* include = Env("RELAYSTORE_LOG_INCLUDE_TRACE_CONTEXT")) {
    options.include_trace_context = std::string(include) == "1" || std::string(include) == "true";
  } else {
    options.include_trace_context = config.include_trace_context();
  }

  return options;
}

void InitializeLogging(const relaystore::runtime::config::LoggingConfig& config) {
  auto options = ResolveLoggingOptions(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(options.pattern);
  logger->set_level(options.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = options.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(line, field.value);
  }
  return line;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  auto line = FormatLogLine(message, fields);
  if (g_include_trace_context) {
    if (auto trace = TraceContext(); !trace.empty()) {
      line.push_back(' ');
      line.append(trace);
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace relaystore::observability
