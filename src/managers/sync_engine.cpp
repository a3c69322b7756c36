#include "sync_engine.hpp"
#include "tool_resolver.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/operation_log.hpp>
#include <core/prompter.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/remote_path.hpp>
#include <ssh/remote_session.hpp>
#include <ssh/ssh_args.hpp>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

const char* to_string(SyncOutcome outcome) {
    switch (outcome) {
        case SyncOutcome::COMPLETED:           return "completed";
        case SyncOutcome::DECLINED:            return "declined";
        case SyncOutcome::DRY_RUN_UNSUPPORTED: return "dry-run-unsupported";
    }
    return "unknown";
}

static std::string strip_trailing_slashes(std::string p) {
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

static std::string remote_spec(const SyncProfile& profile) {
    return profile.target.destination() + ":" + strip_trailing_slashes(profile.remote_dir) + "/";
}

SyncEngine::SyncEngine(platform::ProcessRunner& runner, ToolResolver& tools,
                       Prompter& prompter, OperationLog& log, int command_timeout_ms)
    : runner_(runner), tools_(tools), prompter_(prompter), log_(log),
      channel_(runner), command_timeout_ms_(command_timeout_ms) {}

// ── State ───────────────────────────────────────────────────

bool SyncEngine::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ != nullptr;
}

SyncState SyncEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int SyncEngine::add_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

void SyncEngine::remove_state_listener(int token) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(token);
}

void SyncEngine::set_state(const std::shared_ptr<ActiveTransfer>& transfer, SyncState state,
                           const std::string& profile) {
    std::vector<StateListener> to_notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (latest_ != transfer) return;
        state_ = state;
        for (const auto& [token, listener] : listeners_) to_notify.push_back(listener);
    }
    hpcsync_log(fmt::format("sync: state -> {} ({})", to_string(state), profile));
    for (const auto& listener : to_notify) listener(state, profile);
}

void SyncEngine::throw_if_cancelled(const ActiveTransfer& transfer) {
    if (transfer.cancelled) {
        throw CancelledError("Sync cancelled");
    }
}

// ── Validation ──────────────────────────────────────────────

void SyncEngine::validate(const SyncProfile& profile) const {
    if (profile.sync_mode != SyncMode::PUSH) {
        throw ValidationError(fmt::format(
            "Profile '{}' uses sync mode '{}'; only push is supported",
            profile.name, profile.sync_mode == SyncMode::PULL ? "pull" : "both"));
    }
    if (trimmed(profile.remote_dir).empty()) {
        throw ValidationError(fmt::format("Profile '{}' has no remote directory", profile.name));
    }
    if (is_remote_root(profile.remote_dir)) {
        throw ValidationError("Refusing to sync to the remote root directory '/'");
    }
    if (profile.local_dir.empty()) {
        throw ValidationError(fmt::format("Profile '{}' has no local directory", profile.name));
    }
    std::error_code ec;
    std::string local = platform::expand_home(profile.local_dir);
    if (!fs::is_directory(local, ec)) {
        throw ValidationError("Local directory does not exist: " + local);
    }
}

// ── Command lines ───────────────────────────────────────────

platform::ProcessSpec SyncEngine::rsync_spec(const SyncProfile& profile, const ToolInfo& rsync,
                                             bool dry_run,
                                             const std::map<std::string, std::string>& env) {
    std::vector<std::string> args = {"-avz", "--progress"};
    if (dry_run) args.push_back("--dry-run");
    if (profile.delete_on_sync) args.push_back("--delete");
    for (const auto& pattern : profile.exclude_patterns) {
        args.push_back("--exclude=" + pattern);
    }
    args.push_back("-e");
    args.push_back(rsync_ssh_command(profile.target, !env.empty()));

    std::string local = strip_trailing_slashes(platform::expand_home(profile.local_dir));

    platform::ProcessSpec spec;
    spec.env = env;
    if (rsync.via_compat) {
        // Windows path -> /mnt/c/... inside the compatibility layer
        platform::ProcessSpec conv;
        conv.program = COMPAT_LAYER_EXE;
        conv.args = {"wslpath", "-u", local};
        auto r = runner_.run(conv, command_timeout_ms_);
        hpcsync_log_cmd("wslpath", conv, r);
        if (r.failed()) {
            throw ProcessError(fmt::format("Could not convert '{}' with wslpath", local),
                               r.exit_code, r.stderr_data);
        }
        local = strip_trailing_slashes(trimmed(r.stdout_data));

        spec.program = COMPAT_LAYER_EXE;
        spec.args.push_back(rsync.path);
    } else {
        spec.program = rsync.path;
    }
    spec.args.insert(spec.args.end(), args.begin(), args.end());
    spec.args.push_back(local + "/");
    spec.args.push_back(remote_spec(profile));
    return spec;
}

platform::ProcessSpec SyncEngine::scp_spec(const SyncProfile& profile,
                                           const std::map<std::string, std::string>& env) {
    platform::ProcessSpec spec;
    spec.program = SCP_EXE;
    spec.env = env;
    spec.args = build_scp_options(profile.target, !env.empty());

    // Every top-level entry, dotfiles included, in a stable order.
    std::vector<std::string> entries;
    std::string local = platform::expand_home(profile.local_dir);
    for (const auto& entry : fs::directory_iterator(local)) {
        entries.push_back(entry.path().string());
    }
    std::sort(entries.begin(), entries.end());
    spec.args.insert(spec.args.end(), entries.begin(), entries.end());
    spec.args.push_back(remote_spec(profile));
    return spec;
}

// scp cannot delete, so files directly inside the target are removed first.
// Subdirectories are left alone: this is one level, unlike rsync --delete.
void SyncEngine::clear_remote_files(const SyncProfile& profile, RemoteSession* session) {
    std::string cmd = fmt::format(
        "find {} -mindepth 1 -maxdepth 1 ! -type d -exec rm -f -- {{}} +",
        shell_quote(strip_trailing_slashes(profile.remote_dir)));
    log_.append_line("> ssh " + profile.target.destination() + " " + cmd);

    if (session) {
        session->run(cmd);
    } else {
        channel_.execute(profile.target, cmd, nullptr, command_timeout_ms_);
    }
}

// ── Transfer ────────────────────────────────────────────────

void SyncEngine::run_transfer(const std::shared_ptr<ActiveTransfer>& transfer,
                              const platform::ProcessSpec& spec) {
    log_.append_line("> " + platform::describe(spec));

    throw_if_cancelled(*transfer);

    auto child = runner_.start(spec);
    platform::ChildProcess* raw = child.get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfer->child = std::move(child);
        if (transfer->cancelled) raw->terminate_tree();
    }

    auto result = raw->wait_streaming([this](const std::string& line, bool is_stderr) {
        if (trimmed(line).empty()) return;
        log_.append_line(is_stderr ? "[stderr] " + line : line);
    });
    hpcsync_log_cmd("transfer", spec, result);

    throw_if_cancelled(*transfer);
    if (result.spawn_failed) {
        throw ProcessError(fmt::format("Failed to start {}: {}", spec.program,
                                       trimmed(result.stderr_data)),
                           result.exit_code, result.stderr_data);
    }
    if (result.exit_code != 0) {
        throw ProcessError(fmt::format("Process exited with code {}", result.exit_code),
                           result.exit_code, result.stderr_data);
    }
}

SyncOutcome SyncEngine::push(const SyncProfile& profile, bool dry_run, RemoteSession* session) {
    auto transfer = std::make_shared<ActiveTransfer>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            throw ValidationError("A sync is already in progress. Cancel it first.");
        }
        active_ = transfer;
        latest_ = transfer;
    }

    // Release the gate on every exit path, unless cancel() already did.
    struct Release {
        SyncEngine& engine;
        std::shared_ptr<ActiveTransfer> transfer;
        ~Release() {
            std::lock_guard<std::mutex> lock(engine.mutex_);
            if (engine.active_ == transfer) engine.active_.reset();
        }
    } release{*this, transfer};

    validate(profile);

    std::string remote = strip_trailing_slashes(profile.remote_dir);
    if (profile.delete_on_sync && !dry_run) {
        bool yes = prompter_.confirm(fmt::format(
            "Delete remote files in {}:{} that do not exist locally?",
            profile.target.destination(), remote));
        if (!yes) {
            log_.append_line("Sync declined: delete confirmation refused");
            return SyncOutcome::DECLINED;
        }
    }
    throw_if_cancelled(*transfer);

    ToolInfo rsync = tools_.resolve(RSYNC_EXE);
    ToolInfo scp = rsync.available ? ToolInfo{} : tools_.resolve(SCP_EXE);
    throw_if_cancelled(*transfer);
    if (!rsync.available && !scp.available) {
        set_state(transfer, SyncState::ERROR, profile.name);
        throw ToolUnavailableError(
            "Neither rsync nor scp found. Please install rsync or ensure scp is available.");
    }

    set_state(transfer, SyncState::SYNCING, profile.name);
    log_.append_line(fmt::format("--- Sync started: {} ---", format_clock(std::time(nullptr))));
    log_.append_line("Profile: " + profile.name);
    log_.append_line(fmt::format("Direction: push{}", dry_run ? " (dry run)" : ""));

    std::map<std::string, std::string> env;
    if (session) env = session->askpass_environment();

    try {
        if (rsync.available) {
            run_transfer(transfer, rsync_spec(profile, rsync, dry_run, env));
        } else {
            if (dry_run) {
                prompter_.warn("Dry run is not supported with scp fallback.");
                set_state(transfer, SyncState::IDLE, profile.name);
                return SyncOutcome::DRY_RUN_UNSUPPORTED;
            }
            prompter_.warn("rsync not found, using scp (full copy, not incremental). "
                           "Exclude patterns will be ignored.");
            if (profile.delete_on_sync) {
                throw_if_cancelled(*transfer);
                clear_remote_files(profile, session);
            }
            run_transfer(transfer, scp_spec(profile, env));
        }
    } catch (const CancelledError&) {
        log_.append_line("--- Sync cancelled ---");
        set_state(transfer, SyncState::IDLE, profile.name);
        throw;
    } catch (const std::exception& e) {
        if (transfer->cancelled) {
            log_.append_line("--- Sync cancelled ---");
            set_state(transfer, SyncState::IDLE, profile.name);
            throw CancelledError("Sync cancelled");
        }
        log_.append_line(fmt::format("--- Sync failed: {} ---", e.what()));
        set_state(transfer, SyncState::ERROR, profile.name);
        throw;
    }

    log_.append_line("--- Sync completed successfully ---");
    set_state(transfer, SyncState::SYNCED, profile.name);
    return SyncOutcome::COMPLETED;
}

bool SyncEngine::cancel() {
    std::shared_ptr<ActiveTransfer> transfer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return false;
        transfer = active_;
        active_.reset();
        transfer->cancelled = true;
        if (transfer->child) transfer->child->terminate_tree();
    }
    hpcsync_log("sync: cancel requested");
    return true;
}
