#include "../hpcsync_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <fmt/format.h>
#include <core/errors.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <ssh/remote_path.hpp>

// Relative paths are taken from the explorer root.
static std::string resolve_path(BaseCLI& cli, const std::string& path) {
    if (path.empty()) return cli.explorer.root();
    if (path[0] == '/') return normalize_remote_path(path);
    return normalize_remote_path(cli.explorer.root() + "/" + path);
}

static std::string format_size(int64_t bytes) {
    if (bytes < 1024) return fmt::format("{}B", bytes);
    if (bytes < 1024 * 1024) return fmt::format("{:.1f}K", bytes / 1024.0);
    if (bytes < 1024LL * 1024 * 1024) return fmt::format("{:.1f}M", bytes / (1024.0 * 1024));
    return fmt::format("{:.1f}G", bytes / (1024.0 * 1024 * 1024));
}

static void print_entry(const RemoteEntry& e, int indent) {
    std::string pad(static_cast<size_t>(indent) * 2, ' ');
    if (e.is_directory) {
        std::cout << "    " << pad << theme::blue(e.name + "/") << "\n";
    } else {
        std::cout << "    " << pad << fmt::format("{:<32}", e.name)
                  << theme::dim(fmt::format("{:>8}  {}", format_size(e.size),
                                            format_epoch(e.mtime)))
                  << "\n";
    }
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;

    std::string dir = resolve_path(cli, trimmed(arg));
    auto entries = cli.explorer.session()->list_directory(dir);
    std::sort(entries.begin(), entries.end(), [](const RemoteEntry& a, const RemoteEntry& b) {
        if (a.is_directory != b.is_directory) return a.is_directory;
        return a.name < b.name;
    });

    std::cout << theme::section(dir);
    if (entries.empty()) {
        std::cout << theme::dim("    (empty)") << "\n";
    }
    for (const auto& e : entries) print_entry(e, 0);
    std::cout << "\n";
}

static void do_tree(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;

    auto entries = cli.explorer.tree();
    std::cout << theme::section(fmt::format("{} (depth {})", cli.explorer.root(),
                                            cli.explorer.profile()->remote_tree_depth));
    for (const auto& e : entries) print_entry(e.entry, e.depth - 1);
    std::cout << theme::dim(fmt::format("    {} entries", entries.size())) << "\n\n";
}

static void do_stat(BaseCLI& cli, const std::string& arg) {
    if (trimmed(arg).empty()) {
        std::cout << theme::fail("Usage: stat <path>");
        return;
    }
    if (!cli.require_connection()) return;

    std::string path = resolve_path(cli, trimmed(arg));
    RemoteStat st = cli.explorer.stat(path);
    std::cout << theme::kv("Path", path);
    std::cout << theme::kv("Type", st.is_directory ? "directory" : "file");
    std::cout << theme::kv("Size", fmt::format("{} ({} bytes)", format_size(st.size), st.size));
    std::cout << theme::kv("Modified", format_epoch(st.mtime));
}

static void do_cat(BaseCLI& cli, const std::string& arg) {
    if (trimmed(arg).empty()) {
        std::cout << theme::fail("Usage: cat <path>");
        return;
    }
    if (!cli.require_connection()) return;

    std::string content = cli.explorer.read(resolve_path(cli, trimmed(arg)));
    std::cout << content;
    if (!content.empty() && content.back() != '\n') std::cout << "\n";
}

static void do_get(BaseCLI& cli, const std::string& arg) {
    auto words = split_args(arg);
    if (words.empty() || words.size() > 2) {
        std::cout << theme::fail("Usage: get <remote> [local]");
        return;
    }
    if (!cli.require_connection()) return;

    std::string remote = resolve_path(cli, words[0]);
    std::string local = words.size() == 2 ? words[1]
                                          : remote.substr(remote.find_last_of('/') + 1);

    std::string content = cli.explorer.read(remote);
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write " + local);
    }
    out << content;
    std::cout << theme::ok(fmt::format("{} -> {} ({})", remote, local,
                                       format_size(static_cast<int64_t>(content.size()))));
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    auto words = split_args(arg);
    if (words.size() != 2) {
        std::cout << theme::fail("Usage: put <local> <remote>");
        return;
    }

    std::ifstream in(words[0], std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read " + words[0]);
    }
    std::stringstream buf;
    buf << in.rdbuf();

    if (!cli.require_connection()) return;

    std::string remote = resolve_path(cli, words[1]);
    cli.explorer.write(remote, buf.str());
    std::cout << theme::ok(fmt::format("{} -> {}", words[0], remote));
}

static void do_refresh(BaseCLI& cli, const std::string& arg) {
    cli.explorer.refresh();
    std::cout << theme::ok("Remote listings will be fetched again.");
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    cli.explorer.create_directory(resolve_path(cli, trimmed(arg)));
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    cli.explorer.remove(resolve_path(cli, trimmed(arg)));
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    auto words = split_args(arg);
    if (words.size() != 2) {
        std::cout << theme::fail("Usage: mv <from> <to>");
        return;
    }
    cli.explorer.rename(resolve_path(cli, words[0]), resolve_path(cli, words[1]));
}

void register_remote_commands(BaseCLI& cli) {
    cli.add_command("ls", do_ls, "List a remote directory [path]");
    cli.add_command("tree", do_tree, "Show the remote tree down to remote_tree_depth");
    cli.add_command("stat", do_stat, "Show type, size and mtime of a remote path");
    cli.add_command("cat", do_cat, "Print a remote file");
    cli.add_command("get", do_get, "Download a remote file <remote> [local]");
    cli.add_command("put", do_put, "Upload a file <local> <remote> (editable profiles)");
    cli.add_command("refresh", do_refresh, "Forget cached remote listings");
    cli.add_command("mkdir", do_mkdir, "Create a remote directory (not supported)");
    cli.add_command("rm", do_rm, "Delete a remote path (not supported)");
    cli.add_command("mv", do_mv, "Rename a remote path (not supported)");
}
