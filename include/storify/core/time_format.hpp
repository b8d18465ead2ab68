#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace storify::timefmt {

using TimePoint = std::chrono::system_clock::time_point;

// "2023-12-15T14:30:00.000Z" and "2023-12-15T14:30:00Z" (S3, Azure listings)
std::optional<TimePoint> parse_iso8601(const std::string& s);

// "Fri, 15 Dec 2023 14:30:00 GMT" (Last-Modified headers)
std::optional<TimePoint> parse_http_date(const std::string& s);

TimePoint from_unix_millis(int64_t millis);

// "2023-12-15T14:30:00Z"
std::string format_iso8601(TimePoint tp);

// "Fri, 15 Dec 2023 14:30:00 GMT"
std::string format_http_date(TimePoint tp);

// "2023-12-15 14:30:00" in UTC, for listings
std::string format_listing(TimePoint tp);

} // namespace storify::timefmt
