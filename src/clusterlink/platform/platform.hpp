#pragma once

#include <string>
#include <filesystem>

namespace clusterlink {
namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
// Falls back to the temp directory when neither is set.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// ~/.clusterlink
std::filesystem::path app_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Local user name from the environment ("" when unknown).
std::string local_username();

} // namespace platform
} // namespace clusterlink
