#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <functional>

namespace platform {

// What to launch. env entries are layered over the inherited environment.
struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string stdin_data;                 // written then closed; empty = /dev/null
};

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool spawn_failed = false;              // exec failed (usually: not on PATH)
    int term_signal = 0;                    // non-zero if killed by a signal

    bool success() const {
        return !timed_out && !spawn_failed && term_signal == 0 && exit_code == 0;
    }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Called once per output line. '\n' and '\r' both end a line.
using LineCallback = std::function<void(const std::string& line, bool is_stderr)>;

// A started child. Each child leads its own session / process group, so
// terminate_tree() reaches anything it spawned (e.g. wsl -> rsync -> ssh).
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual int pid() const = 0;

    // Pump stdout/stderr to on_line until the child exits.
    virtual ProcessResult wait_streaming(const LineCallback& on_line) = 0;

    // SIGTERM the process group, escalating to SIGKILL after a grace period.
    // Safe to call from another thread while wait_streaming() is running.
    virtual void terminate_tree() = 0;
};

// Seam for everything that spawns processes.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Run to completion, capturing output. timeout_ms <= 0 means no limit.
    // On timeout the whole process group is killed and timed_out is set.
    virtual ProcessResult run(const ProcessSpec& spec, int timeout_ms) = 0;

    // Start a long-running child whose output is consumed by wait_streaming().
    virtual std::unique_ptr<ChildProcess> start(const ProcessSpec& spec) = 0;
};

// Handle to a spawned child process (fork/exec, pipes on stdin/stdout/stderr).
class ProcessHandle : public ChildProcess {
public:
    explicit ProcessHandle(const ProcessSpec& spec);
    ~ProcessHandle() override;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process was successfully spawned.
    bool valid() const { return pid_ > 0; }
    int spawn_errno() const { return spawn_errno_; }

    int pid() const override { return pid_; }
    ProcessResult wait_streaming(const LineCallback& on_line) override;
    void terminate_tree() override;

    // Collect all output, killing the group if the deadline passes.
    ProcessResult wait_captured(int timeout_ms);

private:
    int pid_ = -1;
    int spawn_errno_ = 0;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::string stdin_data_;
    size_t stdin_written_ = 0;

    std::mutex reap_mutex_;
    bool reaped_ = false;
    std::atomic<bool> terminate_requested_{false};
    std::atomic<long long> kill_at_ms_{0};  // steady clock, when SIGTERM becomes SIGKILL

    void spawn(const ProcessSpec& spec);
    ProcessResult pump(const LineCallback* on_line, bool collect,
                       std::chrono::steady_clock::time_point deadline, bool has_deadline);
    bool try_reap(ProcessResult& result);
    void signal_group(int sig);
    void close_fds();
};

class PosixProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const ProcessSpec& spec, int timeout_ms) override;
    std::unique_ptr<ChildProcess> start(const ProcessSpec& spec) override;
};

// Run with the caller's terminal inherited (interactive ssh). Blocks until
// the child exits and returns its exit code, or -1 if it could not start.
int run_foreground(const std::string& program, const std::vector<std::string>& args);

// Render a spec as a single display line: `program arg arg`.
std::string describe(const ProcessSpec& spec);

} // namespace platform
