#include "hpcsync_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <filesystem>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <managers/remote_browser.hpp>
#include <ssh/remote_session.hpp>

// ── Prompt helpers ──────────────────────────────────────

static std::string join_patterns(const std::vector<std::string>& patterns) {
    std::string out;
    for (size_t i = 0; i < patterns.size(); i++) {
        if (i > 0) out += ", ";
        out += patterns[i];
    }
    return out;
}

static std::vector<std::string> split_patterns(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// Throwaway session: authenticated for the pick, disposed right after.
static std::optional<std::string> browse_remote_dir(BaseCLI& cli, const ConnectionTarget& target,
                                                    const std::string& start) {
    RemoteSession session(target, cli.channel, cli.prompter, cli.timeouts());
    RemoteBrowser browser(session, cli.prompter);
    auto chosen = browser.browse(start);
    session.dispose();
    return chosen;
}

// ── Profile wizard ──────────────────────────────────────

std::optional<SyncProfile> run_profile_wizard(BaseCLI& cli, const std::string& name,
                                              const SyncProfile* base) {
    SyncProfile p;
    if (base) {
        p = *base;
    } else {
        p.exclude_patterns = default_exclude_patterns();
        p.local_dir = std::filesystem::current_path().string();
        p.remote_tree_depth = cli.config.remote_tree_depth;
    }
    p.name = name;

    std::cout << theme::section("Profile " + name);
    std::cout << theme::dim("    Press Enter to keep the value in brackets.") << "\n\n";

    auto host = cli.prompter.line("SSH host", p.target.host);
    if (!host) return std::nullopt;
    p.target.host = trimmed(*host);
    if (p.target.host.empty()) {
        std::cout << theme::fail("SSH host is required.");
        return std::nullopt;
    }

    auto user = cli.prompter.line("SSH user (blank = ssh default)", p.target.user);
    if (!user) return std::nullopt;
    p.target.user = trimmed(*user);

    auto port = cli.prompter.line("SSH port (blank = 22)",
                                  p.target.port ? std::to_string(*p.target.port) : "");
    if (!port) return std::nullopt;
    std::string port_text = trimmed(*port);
    if (port_text.empty()) {
        p.target.port.reset();
    } else {
        int64_t n = 0;
        if (!parse_int64(port_text, n) || n < 1 || n > 65535) {
            std::cout << theme::fail("Port must be a number from 1 to 65535.");
            return std::nullopt;
        }
        p.target.port = static_cast<int>(n);
    }

    auto identity = cli.prompter.line("Identity file (blank = ssh default keys)",
                                      p.target.identity_file);
    if (!identity) return std::nullopt;
    p.target.identity_file = trimmed(*identity);

    auto target_ok = validate_target(p.target);
    if (target_ok.is_err()) {
        std::cout << theme::fail(target_ok.error);
        return std::nullopt;
    }

    auto local = cli.prompter.line("Local directory", p.local_dir);
    if (!local) return std::nullopt;
    p.local_dir = trimmed(*local);

    if (cli.prompter.confirm("Browse the remote host for the target directory?")) {
        try {
            auto chosen = browse_remote_dir(cli, p.target, p.remote_dir);
            if (chosen) p.remote_dir = *chosen;
        } catch (const RemoteError& e) {
            std::cout << theme::fail(fmt::format("Browse failed: {}", e.what()));
        }
    }

    auto remote = cli.prompter.line("Remote directory", p.remote_dir);
    if (!remote) return std::nullopt;
    p.remote_dir = trimmed(*remote);

    auto exclude = cli.prompter.line("Exclude patterns (comma separated)",
                                     join_patterns(p.exclude_patterns));
    if (!exclude) return std::nullopt;
    p.exclude_patterns = split_patterns(*exclude);

    p.delete_on_sync = cli.prompter.confirm(
        "Delete remote files that do not exist locally when pushing?");
    p.remote_files_editable = cli.prompter.confirm("Allow editing remote files (put)?");

    auto valid = validate_profile(p);
    if (valid.is_err()) {
        std::cout << theme::fail(valid.error);
        return std::nullopt;
    }
    if (p.remote_dir.empty()) {
        std::cout << theme::fail("Remote directory is required.");
        return std::nullopt;
    }

    std::cout << theme::divider();
    std::cout << theme::kv("Host", p.target.destination() +
                           (p.target.port ? fmt::format(" (port {})", *p.target.port) : ""));
    std::cout << theme::kv("Local", p.local_dir);
    std::cout << theme::kv("Remote", p.remote_dir);
    std::cout << theme::kv("Exclude", join_patterns(p.exclude_patterns));
    std::cout << theme::kv("Delete", p.delete_on_sync ? "yes" : "no");
    return p;
}
