#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/types.hpp>
#include <ssh/remote_session.hpp>

class CommandChannel;
class Prompter;

struct ExplorerEntry {
    std::string path;
    RemoteEntry entry;
    int depth = 0;                          // 1 = direct child of the tree root
};

// Connection state plus a filesystem view of the active profile's remote
// tree. Writes honor remote_files_editable; structural changes are refused.
class RemoteExplorer {
public:
    RemoteExplorer(CommandChannel& channel, Prompter& prompter,
                   RemoteSession::Timeouts timeouts = RemoteSession::Timeouts{});

    // Open a session for profile and authenticate. Replaces any previous one.
    void connect(const SyncProfile& profile);
    void disconnect();
    bool connected() const;

    const std::optional<SyncProfile>& profile() const { return profile_; }
    RemoteSession* session() { return session_.get(); }

    // Drop cached listings.
    void refresh();

    // remote_tree_root, or remote_dir when unset. Normalized.
    std::string root() const;

    // Entries of path (root when empty), directories first then by name.
    // Empty once path is remote_tree_depth levels below the root.
    std::vector<ExplorerEntry> children(const std::string& path = "");

    // Depth-first walk of everything children() would show.
    std::vector<ExplorerEntry> tree();

    RemoteStat stat(const std::string& path);
    std::string read(const std::string& path);
    void write(const std::string& path, const std::string& content);

    void create_directory(const std::string& path);
    void remove(const std::string& path);
    void rename(const std::string& from, const std::string& to);

private:
    CommandChannel& channel_;
    Prompter& prompter_;
    RemoteSession::Timeouts timeouts_;
    std::optional<SyncProfile> profile_;
    std::unique_ptr<RemoteSession> session_;

    RemoteSession& require_session();
    int depth_of(const std::string& path) const;
    void walk(const std::string& path, std::vector<ExplorerEntry>& out);
};
