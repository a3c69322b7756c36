#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences. BLUE #3E78B2, BROWN #80633A.
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string blue(const std::string& s)   { return color::BLUE + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)  { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)    { return color::RED + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

constexpr const char* VERSION = "0.1.0";

inline std::string rule(int width = 48) {
    std::string line;
    for (int i = 0; i < width; ++i) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD + "  hpcsync" + color::RESET
           + color::DIM + "  v" + VERSION + "\n"
           + "  push-sync and browse remote hosts over ssh" + color::RESET + "\n\n"
           + rule();
}

// Blank line on both sides.
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Tool output, dimmer than our own messages
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
