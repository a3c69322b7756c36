#include "remote_listing.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

static bool is_space(char c) {
    return c == ' ' || c == '\t';
}

// Position of field `index` (0-based) in line, or npos.
static size_t field_start(const std::string& line, int index) {
    size_t pos = 0;
    for (int field = 0; ; ++field) {
        while (pos < line.size() && is_space(line[pos])) ++pos;
        if (pos >= line.size()) return std::string::npos;
        if (field == index) return pos;
        while (pos < line.size() && !is_space(line[pos])) ++pos;
    }
}

static std::string field_at(const std::string& line, int index) {
    size_t start = field_start(line, index);
    if (start == std::string::npos) return "";
    size_t end = start;
    while (end < line.size() && !is_space(line[end])) ++end;
    return line.substr(start, end - start);
}

std::vector<RemoteEntry> parse_ls_output(const std::string& raw) {
    std::vector<RemoteEntry> entries;

    for (const auto& l : split_lines(raw)) {
        std::string line = trimmed(l);
        if (line.empty() || line.rfind("total", 0) == 0) continue;

        size_t name_pos = field_start(line, 6);
        if (name_pos == std::string::npos) continue;

        std::string perms = field_at(line, 0);
        RemoteEntry e;
        if (!parse_int64(field_at(line, 4), e.size)) continue;
        if (!parse_int64(field_at(line, 5), e.mtime)) continue;

        e.name = line.substr(name_pos);
        if (perms[0] == 'l') {
            auto arrow = e.name.find(" -> ");
            if (arrow != std::string::npos) e.name.erase(arrow);
        }
        if (e.name == "." || e.name == "..") continue;

        e.is_directory = perms[0] == 'd';
        entries.push_back(e);
    }
    return entries;
}

RemoteStat parse_stat_output(const std::string& raw) {
    RemoteStat st;
    std::string text = trimmed(raw);

    std::string head = text.substr(0, 9);
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    st.is_directory = head == "directory";

    static const std::regex tail(R"((\d+)\s+(\d+)$)");
    std::smatch m;
    int64_t size = 0, mtime = 0;
    if (std::regex_search(text, m, tail) &&
        parse_int64(m[1].str(), size) && parse_int64(m[2].str(), mtime)) {
        st.size = size;
        st.mtime = mtime;
    }
    return st;
}

std::vector<std::string> parse_dir_names(const std::string& raw) {
    std::vector<std::string> dirs;
    for (const auto& l : split_lines(raw)) {
        std::string name = trimmed(l);
        if (name.size() > 1 && name.back() == '/') {
            name.pop_back();
            if (name == "." || name == "..") continue;
            dirs.push_back(name);
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}
