#include "platform.hpp"
#include <chrono>
#include <cstdlib>
#include <thread>

namespace fs = std::filesystem;

namespace clusterlink {
namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return tmp;
}

fs::path app_dir() {
    return home_dir() / ".clusterlink";
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

std::string local_username() {
#ifdef _WIN32
    const char* user = std::getenv("USERNAME");
#else
    const char* user = std::getenv("USER");
    if (!user) user = std::getenv("LOGNAME");
#endif
    return user ? user : "";
}

} // namespace platform
} // namespace clusterlink
