#include "platform.hpp"
#include <cstdlib>
#include <ctime>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                          std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.rfind("~/", 0) == 0) return home_dir() / path.substr(2);
    return fs::path(path);
}

} // namespace platform
