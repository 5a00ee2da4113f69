#pragma once

#include <string>
#include <cstdint>

// Generate an ISO 8601 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ) for the current time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse a byte count with an optional binary suffix: "512", "64M", "4GiB", "1T".
// Returns false if the string is not a valid size.
bool parse_byte_size(const std::string& s, uint64_t& out);

// Encode an object key so it can be used as a single filename component.
// Unreserved characters pass through; everything else becomes %XX.
std::string escape_key(const std::string& key);
std::string unescape_key(const std::string& escaped);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
