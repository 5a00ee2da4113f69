#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <core/types.hpp>
#include <core/time_utils.hpp>

// Daily UTC interval [start, end) in minutes since midnight. end <= start
// means the window runs past midnight (22:00-06:00).
struct ScheduleWindow {
    int start_minute = 0;
    int end_minute = 0;

    int length_minutes() const;
    std::string to_string() const;
};

// Parse "HH:MM-HH:MM". "24:00" is accepted as an end time.
Result<ScheduleWindow> parse_schedule_window(const std::string& text);

class Schedule {
public:
    Schedule() = default;
    explicit Schedule(std::vector<ScheduleWindow> windows);

    // No windows configured: transfers may run at any time.
    bool always_open() const { return windows_.empty(); }
    const std::vector<ScheduleWindow>& windows() const { return windows_; }

    bool is_open(TimePoint now) const;

    // Earliest time >= now at which something lasting `needed` can start
    // inside one window: now if the current window has room, else the first
    // window today or tomorrow long enough, else the next start of the longest
    // window (the work then runs past its end).
    TimePoint start_for(TimePoint now, std::chrono::seconds needed) const;

private:
    std::vector<ScheduleWindow> windows_;
};
