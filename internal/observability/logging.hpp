#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace relaystore::runtime::config {
class LoggingConfig;
}

namespace relaystore::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DurationField(std::string_view key, std::int64_t millis);

struct LoggingOptions {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
  bool                      include_trace_context = false;
};

/*
  RELAYSTORE_LOG_LEVEL, RELAYSTORE_LOG_PATTERN and
  RELAYSTORE_LOG_INCLUDE_TRACE_CONTEXT override the config file.
  Throws std::invalid_argument on an unknown level name.
*/
LoggingOptions ResolveLoggingOptions(const relaystore::runtime::config::LoggingConfig& config);

// Logs go to stderr; stdout carries the tool's own report.
void InitializeLogging(const relaystore::runtime::config::LoggingConfig& config);
void ShutdownLogging();

// `message key=value key="two words"`
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace relaystore::observability

#define RELAYSTORE_LOG_DEBUG(message, ...) ::relaystore::observability::LogDebug((message), ##__VA_ARGS__)
#define RELAYSTORE_LOG_INFO(message, ...) ::relaystore::observability::LogInfo((message), ##__VA_ARGS__)
#define RELAYSTORE_LOG_WARN(message, ...) ::relaystore::observability::LogWarn((message), ##__VA_ARGS__)
#define RELAYSTORE_LOG_ERROR(message, ...) ::relaystore::observability::LogError((message), ##__VA_ARGS__)
