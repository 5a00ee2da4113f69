#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

using TimePoint = std::chrono::system_clock::time_point;

// Format a UTC time point as ISO 8601 (YYYY-MM-DDTHH:MM:SSZ).
// The epoch (default-constructed TimePoint) formats as "".
std::string to_iso_utc(TimePoint t);

// Parse YYYY-MM-DDTHH:MM:SS[Z] as UTC. Empty string parses to the epoch.
std::optional<TimePoint> parse_iso_utc(const std::string& iso);

// Calendar month key, e.g. "2026-10".
std::string month_key(TimePoint t);

// 00:00:00 UTC on the first day of the month after t.
TimePoint start_of_next_month(TimePoint t);

// 00:00:00 UTC of the day containing t.
TimePoint start_of_day(TimePoint t);

// Minutes since UTC midnight (0..1439).
int minute_of_day(TimePoint t);

// Build a UTC time point from calendar fields (used by tests and config).
TimePoint make_utc(int year, int month, int day, int hour = 0, int min = 0, int sec = 0);

// Format a duration as "2h35m", "14m22s", "8s".
std::string format_duration(std::chrono::seconds d);

// Human-readable time until `when` from `now`: "in 2h35m", or "now" if due.
std::string format_eta(TimePoint when, TimePoint now);

// Human-readable byte count: "512 B", "1.5 MiB", "4.0 GiB".
std::string format_bytes(uint64_t bytes);
