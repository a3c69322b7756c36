#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Parse `ls -la --time-style=+%s` output:
//   drwxr-xr-x 2 user group 4096 1700000000 name with spaces
// Skips "total", ".", "..", and anything that does not have numeric
// size/mtime fields. Symlink names lose their " -> target" suffix.
std::vector<RemoteEntry> parse_ls_output(const std::string& raw);

// Parse GNU `stat --format='%F %s %Y'` or BSD `stat -f '%HT %z %m'` output.
// Unparseable output yields a zeroed, non-directory stat.
RemoteStat parse_stat_output(const std::string& raw);

// Parse `ls -1 -p` output down to directory names (trailing '/' stripped), sorted.
std::vector<std::string> parse_dir_names(const std::string& raw);
