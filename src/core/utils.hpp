#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict decimal parse of the whole string. Returns false on any junk or
// on a value that does not fit in int64_t.
bool parse_int64(const std::string& s, int64_t& out);

// Base64 (RFC 4648, padded). decode skips whitespace and stops at '='.
std::string base64_encode(const std::string& input);
std::string base64_decode(const std::string& input);

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& text);

// Split on runs of whitespace. No quoting.
std::vector<std::string> split_args(const std::string& text);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
