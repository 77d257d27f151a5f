#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cirrus::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string FormatHttpDate(uint64_t unix_ms);

// Accepts IMF-fixdate, RFC 850 and asctime forms. Returns seconds since epoch.
std::optional<int64_t> ParseHttpDate(std::string_view value);

// "2024-01-31T12:00:00.000Z"
std::string FormatIsoTimestamp(uint64_t unix_ms);

// "2024-01-31"
std::string FormatDay(uint64_t unix_ms);

} // namespace cirrus::util
