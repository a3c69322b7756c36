#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// ~/.hpcsync, where config.yaml and profiles.yaml live.
std::filesystem::path app_dir();

// Expands a leading "~" or "~/" to home_dir(). Other paths are returned as-is.
std::string expand_home(const std::string& path);

// Returns a fresh path `<tmp>/<prefix>_<pid>_<n>`. Nothing is created.
std::filesystem::path temp_file(const std::string& prefix);

// True when rsync/ssh run natively. False on hosts that need a POSIX
// compatibility layer (WSL) to run rsync.
bool has_native_posix();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
