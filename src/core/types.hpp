#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One remote endpoint. Immutable for the duration of an operation.
struct ConnectionTarget {
    std::string host;
    std::string user;                       // empty = ssh default
    std::optional<int> port;
    std::string identity_file;              // empty = ssh default keys

    // "user@host" or "host"
    std::string destination() const {
        return user.empty() ? host : user + "@" + host;
    }

    // Identity used for per-target locking: "user@host:port"
    std::string key() const {
        return destination() + ":" + (port ? std::to_string(*port) : std::string("22"));
    }
};

// Parsed line of a remote long-format listing.
struct RemoteEntry {
    std::string name;
    bool is_directory = false;
    int64_t size = 0;
    int64_t mtime = 0;                      // seconds since epoch
};

struct RemoteStat {
    bool is_directory = false;
    int64_t size = 0;
    int64_t mtime = 0;
};

enum class SyncMode { PUSH, PULL, BOTH };

// A named connection + sync configuration, owned by the profile store.
struct SyncProfile {
    std::string name;
    ConnectionTarget target;
    std::string local_dir;
    std::string remote_dir;
    SyncMode sync_mode = SyncMode::PUSH;
    std::vector<std::string> exclude_patterns;
    bool delete_on_sync = false;
    std::string remote_tree_root;           // empty = remote_dir
    int remote_tree_depth = 3;
    bool remote_files_editable = false;
};

enum class SyncState { IDLE, SYNCING, SYNCED, ERROR };

inline const char* to_string(SyncState s) {
    switch (s) {
        case SyncState::IDLE:    return "idle";
        case SyncState::SYNCING: return "syncing";
        case SyncState::SYNCED:  return "synced";
        case SyncState::ERROR:   return "error";
    }
    return "unknown";
}

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
