#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <cstdio>

// timegm is the UTC counterpart of mktime (glibc / BSD).
static std::time_t utc_timegm(struct tm* tm_buf) {
    return timegm(tm_buf);
}

static struct tm utc_fields(TimePoint t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    struct tm tm_buf = {};
    gmtime_r(&tt, &tm_buf);
    return tm_buf;
}

std::string to_iso_utc(TimePoint t) {
    if (t == TimePoint{}) return "";
    struct tm tm_buf = utc_fields(t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

std::optional<TimePoint> parse_iso_utc(const std::string& iso) {
    if (iso.empty()) return TimePoint{};

    struct tm tm_buf = {};
    if (std::sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) != 6) {
        return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(utc_timegm(&tm_buf));
}

std::string month_key(TimePoint t) {
    struct tm tm_buf = utc_fields(t);
    return fmt::format("{:04}-{:02}", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1);
}

TimePoint start_of_next_month(TimePoint t) {
    struct tm tm_buf = utc_fields(t);
    int year = tm_buf.tm_year + 1900;
    int month = tm_buf.tm_mon + 2;  // 1-based, next month
    if (month > 12) {
        month = 1;
        year += 1;
    }
    return make_utc(year, month, 1);
}

TimePoint start_of_day(TimePoint t) {
    struct tm tm_buf = utc_fields(t);
    return make_utc(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
}

int minute_of_day(TimePoint t) {
    struct tm tm_buf = utc_fields(t);
    return tm_buf.tm_hour * 60 + tm_buf.tm_min;
}

TimePoint make_utc(int year, int month, int day, int hour, int min, int sec) {
    struct tm tm_buf = {};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = min;
    tm_buf.tm_sec = sec;
    return std::chrono::system_clock::from_time_t(utc_timegm(&tm_buf));
}

std::string format_duration(std::chrono::seconds d) {
    long long seconds = d.count();
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_eta(TimePoint when, TimePoint now) {
    if (when <= now) return "now";
    auto d = std::chrono::duration_cast<std::chrono::seconds>(when - now);
    return "in " + format_duration(d);
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    return fmt::format("{:.1f} {}", v, units[u]);
}
