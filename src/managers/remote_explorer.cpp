#include "remote_explorer.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <ssh/command_channel.hpp>
#include <ssh/remote_path.hpp>
#include <algorithm>
#include <climits>
#include <fmt/format.h>

RemoteExplorer::RemoteExplorer(CommandChannel& channel, Prompter& prompter,
                               RemoteSession::Timeouts timeouts)
    : channel_(channel), prompter_(prompter), timeouts_(timeouts) {}

// ── Connection ──────────────────────────────────────────────

void RemoteExplorer::connect(const SyncProfile& profile) {
    disconnect();
    profile_ = profile;
    session_ = std::make_unique<RemoteSession>(profile.target, channel_, prompter_, timeouts_);
    try {
        session_->ensure_authenticated();
    } catch (const RemoteError&) {
        session_.reset();
        throw;
    }
    hpcsync_log("explorer: connected to " + profile.target.key());
}

void RemoteExplorer::disconnect() {
    if (session_) {
        session_->dispose();
        session_.reset();
        hpcsync_log("explorer: disconnected");
    }
}

bool RemoteExplorer::connected() const {
    return session_ && session_->is_authenticated();
}

void RemoteExplorer::refresh() {
    if (session_) session_->clear_cache();
}

RemoteSession& RemoteExplorer::require_session() {
    if (!session_) {
        throw UnavailableError("No active SSH session");
    }
    return *session_;
}

// ── Tree ────────────────────────────────────────────────────

std::string RemoteExplorer::root() const {
    if (!profile_) return "/";
    const auto& p = *profile_;
    return normalize_remote_path(p.remote_tree_root.empty() ? p.remote_dir : p.remote_tree_root);
}

int RemoteExplorer::depth_of(const std::string& path) const {
    std::string r = root();
    std::string p = normalize_remote_path(path);
    if (p == r) return 0;

    std::string prefix = r == "/" ? "/" : r + "/";
    if (p.compare(0, prefix.size(), prefix) != 0) return INT_MAX;  // outside the tree

    std::string rel = p.substr(prefix.size());
    return static_cast<int>(std::count(rel.begin(), rel.end(), '/')) + 1;
}

std::vector<ExplorerEntry> RemoteExplorer::children(const std::string& path) {
    RemoteSession& session = require_session();
    std::string dir = path.empty() ? root() : normalize_remote_path(path);

    int depth = depth_of(dir);
    if (depth >= profile_->remote_tree_depth) return {};

    auto entries = session.list_directory(dir);
    std::sort(entries.begin(), entries.end(), [](const RemoteEntry& a, const RemoteEntry& b) {
        if (a.is_directory != b.is_directory) return a.is_directory;
        return a.name < b.name;
    });

    std::vector<ExplorerEntry> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        out.push_back({remote_join(dir, e.name), e, depth + 1});
    }
    return out;
}

void RemoteExplorer::walk(const std::string& path, std::vector<ExplorerEntry>& out) {
    for (const auto& child : children(path)) {
        out.push_back(child);
        if (child.entry.is_directory) walk(child.path, out);
    }
}

std::vector<ExplorerEntry> RemoteExplorer::tree() {
    std::vector<ExplorerEntry> out;
    walk(root(), out);
    return out;
}

// ── Files ───────────────────────────────────────────────────

RemoteStat RemoteExplorer::stat(const std::string& path) {
    RemoteSession& session = require_session();
    try {
        return session.stat(path);
    } catch (const RemoteError& e) {
        hpcsync_log(fmt::format("explorer: stat {} failed: {}", path, e.what()));
        throw NotFoundError("File not found: " + path);
    }
}

std::string RemoteExplorer::read(const std::string& path) {
    RemoteSession& session = require_session();
    try {
        return session.read_file(path);
    } catch (const RemoteError& e) {
        hpcsync_log(fmt::format("explorer: read {} failed: {}", path, e.what()));
        throw NotFoundError("File not found: " + path);
    }
}

void RemoteExplorer::write(const std::string& path, const std::string& content) {
    RemoteSession& session = require_session();
    if (!profile_->remote_files_editable) {
        throw PermissionDeniedError(fmt::format(
            "Remote files are read-only for profile '{}' (set remote_files_editable)",
            profile_->name));
    }
    session.write_file(path, content);
}

void RemoteExplorer::create_directory(const std::string& path) {
    require_session().create_directory(path);
}

void RemoteExplorer::remove(const std::string& path) {
    require_session().remove(path);
}

void RemoteExplorer::rename(const std::string& from, const std::string& to) {
    require_session().rename(from, to);
}
