#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/process.hpp>
#include <ssh/command_channel.hpp>

#include "tool_resolver.hpp"
class Prompter;
class OperationLog;
class RemoteSession;

enum class SyncOutcome {
    COMPLETED,
    DECLINED,               // user said no to the delete confirmation
    DRY_RUN_UNSUPPORTED,    // only scp available
};

const char* to_string(SyncOutcome outcome);

// One-way push of a local directory to a remote one, with rsync when it can
// be found and scp otherwise. At most one transfer runs at a time.
class SyncEngine {
public:
    using StateListener = std::function<void(SyncState state, const std::string& profile)>;

    SyncEngine(platform::ProcessRunner& runner, ToolResolver& tools,
               Prompter& prompter, OperationLog& log,
               int command_timeout_ms = COMMAND_TIMEOUT_SECS * 1000);

    // Blocks until the transfer ends. Throws ValidationError,
    // ToolUnavailableError, ProcessError or CancelledError.
    // When session is authenticated by password its askpass helper is
    // handed to the transfer's own ssh.
    SyncOutcome push(const SyncProfile& profile, bool dry_run, RemoteSession* session = nullptr);

    // Stop the running transfer. Returns false when nothing is running.
    // Safe to call from any thread.
    bool cancel();

    bool active() const;
    SyncState state() const;

    int add_state_listener(StateListener listener);
    void remove_state_listener(int token);

private:
    struct ActiveTransfer {
        std::unique_ptr<platform::ChildProcess> child;
        std::atomic<bool> cancelled{false};
    };

    platform::ProcessRunner& runner_;
    ToolResolver& tools_;
    Prompter& prompter_;
    OperationLog& log_;
    CommandChannel channel_;
    int command_timeout_ms_;

    mutable std::mutex mutex_;
    std::shared_ptr<ActiveTransfer> active_;
    std::shared_ptr<ActiveTransfer> latest_;    // kept after cancel(); owns state_
    SyncState state_ = SyncState::IDLE;
    std::map<int, StateListener> listeners_;
    int next_token_ = 1;

    void validate(const SyncProfile& profile) const;
    // No-op once a newer push has started.
    void set_state(const std::shared_ptr<ActiveTransfer>& transfer, SyncState state,
                   const std::string& profile);
    static void throw_if_cancelled(const ActiveTransfer& transfer);

    platform::ProcessSpec rsync_spec(const SyncProfile& profile, const ToolInfo& rsync,
                                     bool dry_run, const std::map<std::string, std::string>& env);
    platform::ProcessSpec scp_spec(const SyncProfile& profile,
                                   const std::map<std::string, std::string>& env);
    void clear_remote_files(const SyncProfile& profile, RemoteSession* session);

    void run_transfer(const std::shared_ptr<ActiveTransfer>& transfer,
                      const platform::ProcessSpec& spec);
};
