#pragma once

#include <string>

// Remote paths are always POSIX. Normalized form: absolute, no repeated
// slashes, no trailing slash except for "/" itself.
std::string normalize_remote_path(const std::string& path);

// "/a/b" -> "/a", "/a" -> "/", "/" -> "/"
std::string remote_parent(const std::string& path);

// Joins a normalized directory and a single entry name.
std::string remote_join(const std::string& dir, const std::string& name);

inline bool is_remote_root(const std::string& path) {
    return normalize_remote_path(path) == "/";
}
