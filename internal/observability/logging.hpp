#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cirrus::runtime::config {
class RuntimeConfig;
}

namespace cirrus::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the default logger. Level and pattern from config, overridden by
// CIRRUS_LOG_LEVEL / CIRRUS_LOG_PATTERN.
void InitializeLogging(const cirrus::runtime::config::RuntimeConfig& config, std::string_view logger_name = "cirrus");
void ShutdownLogging();

// key=value pairs separated by spaces. Values that are empty or hold
// spaces, quotes or '=' are double quoted with '"' and '\\' escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace cirrus::observability

#define CIRRUS_LOG_INFO(message, ...) ::cirrus::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define CIRRUS_LOG_WARN(message, ...) ::cirrus::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define CIRRUS_LOG_ERROR(message, ...) ::cirrus::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
