#include "remote_path.hpp"

std::string normalize_remote_path(const std::string& path) {
    std::string out = "/";
    for (char c : path) {
        if (c == '/' && out.back() == '/') continue;
        out += c;
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string remote_parent(const std::string& path) {
    std::string p = normalize_remote_path(path);
    auto slash = p.rfind('/');
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string remote_join(const std::string& dir, const std::string& name) {
    std::string d = normalize_remote_path(dir);
    return d == "/" ? "/" + name : d + "/" + name;
}
