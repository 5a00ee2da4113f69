#include "utils.hpp"
#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <chrono>

std::string now_iso() {
    return to_iso_utc(std::chrono::system_clock::now());
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

bool parse_byte_size(const std::string& input, uint64_t& out) {
    std::string s = input;
    trim(s);
    if (s.empty()) return false;

    size_t pos = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    if (pos == 0) return false;

    uint64_t value = 0;
    try {
        value = std::stoull(s.substr(0, pos));
    } catch (const std::exception&) {
        return false;
    }

    std::string suffix = s.substr(pos);
    trim(suffix);
    for (auto& c : suffix) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    // "GIB" / "GB" / "G" are all binary here
    if (suffix.size() == 3 && suffix[1] == 'I' && suffix[2] == 'B') suffix = suffix.substr(0, 1);
    if (suffix.size() == 2 && suffix[1] == 'B') suffix = suffix.substr(0, 1);

    uint64_t mult = 1;
    if (suffix.empty() || suffix == "B") mult = 1;
    else if (suffix == "K") mult = 1024ULL;
    else if (suffix == "M") mult = 1024ULL * 1024;
    else if (suffix == "G") mult = 1024ULL * 1024 * 1024;
    else if (suffix == "T") mult = 1024ULL * 1024 * 1024 * 1024;
    else return false;

    out = value * mult;
    return true;
}

std::string escape_key(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

std::string unescape_key(const std::string& escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] == '%' && i + 2 < escaped.size()) {
            try {
                out += static_cast<char>(std::stoi(escaped.substr(i + 1, 2), nullptr, 16));
                i += 2;
                continue;
            } catch (const std::exception&) {
                // not an escape, keep the literal '%'
            }
        }
        out += escaped[i];
    }
    return out;
}
