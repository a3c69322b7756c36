#include "platform.hpp"
#include <cstdlib>
#include <atomic>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <process.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

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
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

fs::path app_dir() {
    return home_dir() / ".hpcsync";
}

std::string expand_home(const std::string& path) {
    if (path == "~") return home_dir().string();
    if (path.rfind("~/", 0) == 0) return (home_dir() / path.substr(2)).string();
    return path;
}

fs::path temp_file(const std::string& prefix) {
    static std::atomic<unsigned> counter{0};
#ifdef _WIN32
    int pid = _getpid();
#else
    int pid = static_cast<int>(getpid());
#endif
    return temp_dir() / (prefix + "_" + std::to_string(pid) + "_" + std::to_string(counter++));
}

bool has_native_posix() {
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
