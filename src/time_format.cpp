#include "storify/core/time_format.hpp"

#include <cstdio>
#include <ctime>

namespace storify::timefmt {

static std::string format_utc(TimePoint tp, const char* pattern) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&t, &tm_val);
    char buf[64];
    size_t n = strftime(buf, sizeof(buf), pattern, &tm_val);
    return std::string(buf, n);
}

std::optional<TimePoint> parse_iso8601(const std::string& s) {
    int year, month, day, hour, min, sec;
    int millis = 0;
    // Try parsing with milliseconds first
    int fields = sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
                        &year, &month, &day, &hour, &min, &sec, &millis);
    if (fields < 6) {
        millis = 0;
        if (sscanf(s.c_str(), "%d-%d-%dT%d:%d:%dZ",
                   &year, &month, &day, &hour, &min, &sec) != 6) {
            return std::nullopt;
        }
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = 0;
    time_t tt = timegm(&tm);
    if (tt == -1) return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(tt);
    // Fractions come with 1-9 digits; only millisecond precision is kept
    if (fields == 7 && millis > 0) {
        while (millis >= 1000) millis /= 10;
        tp += std::chrono::milliseconds(millis);
    }
    return tp;
}

std::optional<TimePoint> parse_http_date(const std::string& s) {
    std::tm tm = {};
    const char* end = strptime(s.c_str(), "%a, %d %b %Y %H:%M:%S", &tm);
    if (!end) return std::nullopt;
    tm.tm_isdst = 0;
    time_t tt = timegm(&tm);
    if (tt == -1) return std::nullopt;
    return std::chrono::system_clock::from_time_t(tt);
}

TimePoint from_unix_millis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis)));
}

std::string format_iso8601(TimePoint tp) {
    return format_utc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string format_http_date(TimePoint tp) {
    return format_utc(tp, "%a, %d %b %Y %H:%M:%S GMT");
}

std::string format_listing(TimePoint tp) {
    return format_utc(tp, "%Y-%m-%d %H:%M:%S");
}

} // namespace storify::timefmt
