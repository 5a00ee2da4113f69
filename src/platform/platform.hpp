#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp dir if unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Returns a fresh, not-yet-existing path in the temp dir with the given prefix.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Expand a leading "~/" against home_dir().
std::filesystem::path expand_home(const std::string& path);

} // namespace platform
