#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "credential_negotiator.hpp"

class CommandChannel;
class Prompter;

struct RemoteSessionTimeouts {
    int command_ms = COMMAND_TIMEOUT_SECS * 1000;
    int transfer_ms = TRANSFER_TIMEOUT_SECS * 1000;
};

// Pseudo-filesystem over one-shot ssh commands, with a per-directory
// listing cache. All methods are thread-safe and run one at a time.
class RemoteSession {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    using Timeouts = RemoteSessionTimeouts;

    RemoteSession(ConnectionTarget target, CommandChannel& channel, Prompter& prompter,
                  Timeouts timeouts = Timeouts{}, Clock clock = nullptr);
    ~RemoteSession();

    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    const ConnectionTarget& target() const { return target_; }

    void ensure_authenticated();
    bool is_authenticated() const;

    std::vector<RemoteEntry> list_directory(const std::string& path);
    RemoteStat stat(const std::string& path);
    std::string read_file(const std::string& path);
    void write_file(const std::string& path, const std::string& content);

    // Arbitrary command (caller quotes its arguments), short timeout.
    std::string run(const std::string& command);

    // Only list/stat/read/write are backed by the remote side.
    void create_directory(const std::string& path);
    void remove(const std::string& path);
    void rename(const std::string& from, const std::string& to);

    // Askpass variables for ssh children spawned by others (rsync, scp).
    // Empty when authenticated by key.
    std::map<std::string, std::string> askpass_environment() const;
    bool uses_password() const;

    void clear_cache();

    // Delete the credential, forget auth and drop the cache.
    void dispose();

private:
    struct CacheEntry {
        std::vector<RemoteEntry> entries;
        std::chrono::steady_clock::time_point captured;
    };

    ConnectionTarget target_;
    CommandChannel& channel_;
    Timeouts timeouts_;
    Clock clock_;

    mutable std::mutex mutex_;
    CredentialNegotiator negotiator_;
    std::map<std::string, CacheEntry> cache_;

    std::string exec_locked(const std::string& command, int timeout_ms,
                            const std::string& stdin_data = "");
};
