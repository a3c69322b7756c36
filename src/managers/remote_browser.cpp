#include "remote_browser.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/prompter.hpp>
#include <core/utils.hpp>
#include <ssh/remote_listing.hpp>
#include <ssh/remote_path.hpp>
#include <ssh/remote_session.hpp>
#include <ssh/ssh_args.hpp>
#include <fmt/format.h>

static constexpr size_t SELECT_IDX = 0;
static constexpr size_t CREATE_IDX = 1;

RemoteBrowser::RemoteBrowser(RemoteSession& session, Prompter& prompter)
    : session_(session), prompter_(prompter) {}

std::string RemoteBrowser::initial_path(const std::string& start) {
    if (!trimmed(start).empty()) return normalize_remote_path(trimmed(start));

    try {
        std::string home = trimmed(session_.run("echo $HOME"));
        if (!home.empty()) return normalize_remote_path(home);
    } catch (const RemoteError& e) {
        hpcsync_log(std::string("browse: $HOME lookup failed: ") + e.what());
    }
    return "/";
}

std::optional<std::string> RemoteBrowser::browse(const std::string& start) {
    try {
        session_.ensure_authenticated();
    } catch (const RemoteError& e) {
        prompter_.error(e.what());
        return std::nullopt;
    }

    std::string current = initial_path(start);

    while (true) {
        std::vector<std::string> dirs;
        try {
            dirs = parse_dir_names(session_.run("ls -1 -p " + shell_quote(current)));
        } catch (const RemoteError& e) {
            prompter_.error(fmt::format("Failed to list remote directory: {}", e.what()));
            return std::nullopt;
        }

        std::vector<std::string> options = {
            "Select: " + current,
            "Create new directory here...",
        };
        bool at_root = current == "/";
        if (!at_root) options.push_back("..");
        size_t first_dir = options.size();
        options.insert(options.end(), dirs.begin(), dirs.end());

        auto picked = prompter_.choose(current, options);
        if (!picked || *picked >= options.size()) {
            return std::nullopt;
        }

        if (*picked == SELECT_IDX) {
            return current;
        }

        if (*picked == CREATE_IDX) {
            auto name = prompter_.line(fmt::format("New directory name inside {}", current));
            if (!name) continue;
            std::string n = trimmed(*name);
            if (n.empty()) {
                prompter_.error("Name cannot be empty");
                continue;
            }
            if (n.find('/') != std::string::npos) {
                prompter_.error("Name cannot contain /");
                continue;
            }

            std::string created = remote_join(current, n);
            try {
                session_.run("mkdir -p " + shell_quote(created));
            } catch (const RemoteError& e) {
                prompter_.error(fmt::format("Failed to create directory: {}", e.what()));
                continue;
            }
            return created;
        }

        if (!at_root && *picked == first_dir - 1) {
            current = remote_parent(current);
            continue;
        }

        current = remote_join(current, options[*picked]);
    }
}
