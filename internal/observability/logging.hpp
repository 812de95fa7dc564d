#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace telemetry::runtime::config {
class RuntimeConfig;
}

namespace telemetry::observability {

inline constexpr const char* kLoggerName = "telemetry-gate";

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

/*
  key=value pairs separated by spaces. Values that are empty or contain
  spaces, quotes, '=' or control characters are double quoted with C
  escapes, so device names and client-supplied text cannot forge extra
  fields or lines.
*/
std::string FormatFields(std::initializer_list<LogField> fields);

// Level and pattern come from the logging section unless
// TELEMETRY_LOG_LEVEL / TELEMETRY_LOG_PATTERN are set. Safe to call again.
void InitializeLogging(const telemetry::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace telemetry::observability

#define TELEMETRY_LOG_INFO(message, ...) ::telemetry::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define TELEMETRY_LOG_WARN(message, ...) ::telemetry::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define TELEMETRY_LOG_ERROR(message, ...) ::telemetry::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
