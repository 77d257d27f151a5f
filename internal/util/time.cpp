#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <initializer_list>

namespace cirrus::util {

namespace {

std::tm ToUtc(uint64_t unix_ms) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
  std::tm           tm{};
  gmtime_r(&seconds, &tm);
  return tm;
}

std::string Format(const std::tm& tm, const char* format) {
  char buffer[64];
  const auto written = std::strftime(buffer, sizeof(buffer), format, &tm);
  return std::string(buffer, written);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatHttpDate(uint64_t unix_ms) {
  // strftime %a/%b follow the C locale, which is what HTTP requires.
  return Format(ToUtc(unix_ms), "%a, %d %b %Y %H:%M:%S GMT");
}

std::optional<int64_t> ParseHttpDate(std::string_view value) {
  const std::string input(value);
  for (const char* format : {"%a, %d %b %Y %H:%M:%S GMT", "%A, %d-%b-%y %H:%M:%S GMT", "%a %b %e %H:%M:%S %Y"}) {
    std::tm     tm{};
    const char* end = strptime(input.c_str(), format, &tm);
    if (end == nullptr || *end != '\0') {
      continue;
    }
    return static_cast<int64_t>(timegm(&tm));
  }
  return std::nullopt;
}

std::string FormatIsoTimestamp(uint64_t unix_ms) {
  auto      text   = Format(ToUtc(unix_ms), "%Y-%m-%dT%H:%M:%S");
  const int millis = static_cast<int>(unix_ms % 1000);
  char      suffix[8];
  std::snprintf(suffix, sizeof(suffix), ".%03dZ", millis);
  return text + suffix;
}

std::string FormatDay(uint64_t unix_ms) {
  return Format(ToUtc(unix_ms), "%Y-%m-%d");
}

} // namespace cirrus::util
