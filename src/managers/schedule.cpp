#include "schedule.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <optional>
#include <cctype>

static constexpr int MINUTES_PER_DAY = 24 * 60;

int ScheduleWindow::length_minutes() const {
    if (end_minute > start_minute) return end_minute - start_minute;
    return MINUTES_PER_DAY - start_minute + end_minute;
}

std::string ScheduleWindow::to_string() const {
    return fmt::format("{:02}:{:02}-{:02}:{:02}", start_minute / 60, start_minute % 60,
                       end_minute / 60, end_minute % 60);
}

static bool parse_hhmm(const std::string& s, bool allow_24, int& minutes) {
    auto colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || s.size() - colon != 3) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i != colon && !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    int h = safe_stoi(s.substr(0, colon), -1);
    int m = safe_stoi(s.substr(colon + 1), -1);
    if (m < 0 || m > 59) return false;
    if (h == 24 && m == 0 && allow_24) { minutes = MINUTES_PER_DAY; return true; }
    if (h < 0 || h > 23) return false;
    minutes = h * 60 + m;
    return true;
}

Result<ScheduleWindow> parse_schedule_window(const std::string& text) {
    std::string s = text;
    trim(s);
    auto dash = s.find('-');
    if (dash == std::string::npos) {
        return Result<ScheduleWindow>::Err(
            fmt::format("invalid window '{}': expected HH:MM-HH:MM", text));
    }
    std::string a = s.substr(0, dash);
    std::string b = s.substr(dash + 1);
    trim(a);
    trim(b);

    ScheduleWindow w;
    if (!parse_hhmm(a, false, w.start_minute) || !parse_hhmm(b, true, w.end_minute)) {
        return Result<ScheduleWindow>::Err(
            fmt::format("invalid window '{}': expected HH:MM-HH:MM", text));
    }
    if (w.end_minute == MINUTES_PER_DAY) {
        w.end_minute = 0;
        if (w.start_minute == 0) {
            return Result<ScheduleWindow>::Err(
                fmt::format("invalid window '{}': leave windows empty to allow all day", text));
        }
    }
    if (w.start_minute == w.end_minute) {
        return Result<ScheduleWindow>::Err(fmt::format("invalid window '{}': empty", text));
    }
    return Result<ScheduleWindow>::Ok(w);
}

Schedule::Schedule(std::vector<ScheduleWindow> windows) : windows_(std::move(windows)) {
    std::sort(windows_.begin(), windows_.end(),
              [](const ScheduleWindow& a, const ScheduleWindow& b) {
                  return a.start_minute < b.start_minute;
              });
}

namespace {

struct Occurrence {
    TimePoint start;
    TimePoint end;
};

// The window as it occurs starting on the day `day_offset` days from `day`.
Occurrence occurrence(const ScheduleWindow& w, TimePoint day, int day_offset) {
    using std::chrono::minutes;
    TimePoint base = day + std::chrono::hours(24) * day_offset;
    Occurrence o;
    o.start = base + minutes(w.start_minute);
    o.end = o.start + minutes(w.length_minutes());
    return o;
}

} // namespace

bool Schedule::is_open(TimePoint now) const {
    if (always_open()) return true;
    TimePoint today = start_of_day(now);
    for (const auto& w : windows_) {
        // Yesterday's occurrence covers the early hours of a midnight-spanning window.
        for (int offset = -1; offset <= 0; ++offset) {
            Occurrence o = occurrence(w, today, offset);
            if (now >= o.start && now < o.end) return true;
        }
    }
    return false;
}

TimePoint Schedule::start_for(TimePoint now, std::chrono::seconds needed) const {
    if (always_open()) return now;
    TimePoint today = start_of_day(now);

    // Currently inside a window with enough time left.
    for (const auto& w : windows_) {
        for (int offset = -1; offset <= 0; ++offset) {
            Occurrence o = occurrence(w, today, offset);
            if (now >= o.start && now < o.end && o.end - now >= needed) return now;
        }
    }

    // Upcoming window today, then tomorrow, long enough for the work.
    std::optional<TimePoint> best;
    for (int offset = 0; offset <= 1; ++offset) {
        for (const auto& w : windows_) {
            Occurrence o = occurrence(w, today, offset);
            if (o.start <= now || o.end - o.start < needed) continue;
            if (!best || o.start < *best) best = o.start;
        }
        if (best) return *best;
    }

    // Nothing fits: start at the next opening of the longest window.
    const ScheduleWindow* longest = &windows_.front();
    for (const auto& w : windows_) {
        if (w.length_minutes() > longest->length_minutes()) longest = &w;
    }
    Occurrence o = occurrence(*longest, today, 0);
    if (o.start > now) return o.start;
    return occurrence(*longest, today, 1).start;
}
