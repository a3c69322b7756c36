#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace platform {

namespace {

constexpr int GRACE_MS = 2000;          // SIGTERM -> SIGKILL
constexpr int POLL_INTERVAL_MS = 100;
constexpr int POST_EXIT_DRAIN_MS = 200; // grandchildren may hold the pipes open
constexpr size_t STDERR_KEEP_BYTES = 64 * 1024;

long long steady_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool make_pipe(int fds[2]) {
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (overrides.count(entry.substr(0, eq))) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

// Writing stdin to a child that already exited must not kill us.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle(const ProcessSpec& spec) {
    ignore_sigpipe_once();
    spawn(spec);
}

ProcessHandle::~ProcessHandle() {
    if (valid()) {
        bool needs_reap;
        {
            std::lock_guard<std::mutex> lock(reap_mutex_);
            needs_reap = !reaped_;
            if (needs_reap) kill(-pid_, SIGKILL);
            reaped_ = true;
        }
        if (needs_reap) {
            while (waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {}
        }
    }
    close_fds();
}

void ProcessHandle::spawn(const ProcessSpec& spec) {
    bool feed_stdin = !spec.stdin_data.empty();
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, exec_pipe, in_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe) ||
        (feed_stdin && !make_pipe(in_pipe))) {
        spawn_errno_ = errno;
        close_all();
        return;
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> env_strings = build_environment(spec.env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& a : spec.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        spawn_errno_ = errno;
        close_all();
        return;
    }

    if (pid == 0) {
        // Child: new session, so no controlling tty and a process group we can signal.
        setsid();
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGINT, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        if (feed_stdin) {
            dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        environ = envp.data();
        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);
    close_fd(in_pipe[0]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec failed; the child already _exit()ed
        spawn_errno_ = child_errno;
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        close_all();
        return;
    }

    pid_ = pid;
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    stdin_fd_ = in_pipe[1];
    set_nonblock(stdout_fd_);
    set_nonblock(stderr_fd_);
    if (stdin_fd_ >= 0) set_nonblock(stdin_fd_);
    stdin_data_ = spec.stdin_data;
}

void ProcessHandle::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ProcessHandle::signal_group(int sig) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (!reaped_ && pid_ > 0) {
        kill(-pid_, sig);
    }
}

bool ProcessHandle::try_reap(ProcessResult& result) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_) return true;

    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) return false;
    if (r < 0 && errno == EINTR) return false;

    reaped_ = true;
    if (r == pid_) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
            result.exit_code = 128 + result.term_signal;
        }
    }
    return true;
}

void ProcessHandle::terminate_tree() {
    if (!valid()) return;
    kill_at_ms_ = steady_ms() + GRACE_MS;
    terminate_requested_ = true;
    signal_group(SIGTERM);
}

ProcessResult ProcessHandle::pump(const LineCallback* on_line, bool collect,
                                  std::chrono::steady_clock::time_point deadline,
                                  bool has_deadline) {
    ProcessResult result;
    if (!valid()) {
        result.spawn_failed = true;
        result.exit_code = 127;
        result.stderr_data = std::strerror(spawn_errno_);
        return result;
    }

    std::string out_partial, err_partial;
    auto emit_lines = [&](std::string& partial, bool is_stderr, bool flush) {
        if (!on_line) {
            partial.clear();
            return;
        }
        size_t start = 0;
        for (size_t i = 0; i < partial.size(); ++i) {
            if (partial[i] == '\n' || partial[i] == '\r') {
                (*on_line)(partial.substr(start, i - start), is_stderr);
                start = i + 1;
            }
        }
        partial.erase(0, start);
        if (flush && !partial.empty()) {
            (*on_line)(partial, is_stderr);
            partial.clear();
        }
    };

    auto drain = [&](int& fd, bool is_stderr) {
        char buf[4096];
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                std::string chunk(buf, static_cast<size_t>(n));
                if (is_stderr) {
                    if (collect || result.stderr_data.size() < STDERR_KEEP_BYTES) {
                        result.stderr_data += chunk;
                    }
                    if (on_line) { err_partial += chunk; emit_lines(err_partial, true, false); }
                } else {
                    if (collect) result.stdout_data += chunk;
                    if (on_line) { out_partial += chunk; emit_lines(out_partial, false, false); }
                }
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            if (n < 0 && errno == EINTR) continue;
            close_fd(fd);  // EOF or hard error
            return;
        }
    };

    bool exited = false;
    long long exit_seen_ms = 0;

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        struct pollfd fds[3];
        int nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (stdout_fd_ >= 0) { fds[nfds] = {stdout_fd_, POLLIN, 0}; out_idx = nfds++; }
        if (stderr_fd_ >= 0) { fds[nfds] = {stderr_fd_, POLLIN, 0}; err_idx = nfds++; }
        if (stdin_fd_ >= 0)  { fds[nfds] = {stdin_fd_, POLLOUT, 0}; in_idx = nfds++; }

        int rc = poll(fds, static_cast<nfds_t>(nfds), POLL_INTERVAL_MS);
        if (rc < 0 && errno != EINTR) break;

        if (rc > 0) {
            if (out_idx >= 0 && fds[out_idx].revents) drain(stdout_fd_, false);
            if (err_idx >= 0 && fds[err_idx].revents) drain(stderr_fd_, true);
            if (in_idx >= 0 && fds[in_idx].revents) {
                if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                    close_fd(stdin_fd_);
                } else {
                    ssize_t w = write(stdin_fd_, stdin_data_.data() + stdin_written_,
                                      stdin_data_.size() - stdin_written_);
                    if (w > 0) stdin_written_ += static_cast<size_t>(w);
                    if ((w < 0 && errno != EAGAIN && errno != EINTR) ||
                        stdin_written_ >= stdin_data_.size()) {
                        close_fd(stdin_fd_);  // EOF tells the child input is done
                    }
                }
            }
        }

        long long now = steady_ms();
        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            signal_group(SIGKILL);
            result.timed_out = true;
            break;
        }
        if (terminate_requested_ && now >= kill_at_ms_) {
            signal_group(SIGKILL);
        }

        if (!exited) {
            if (try_reap(result)) {
                exited = true;
                exit_seen_ms = now;
            }
        } else if (now - exit_seen_ms > POST_EXIT_DRAIN_MS) {
            break;
        }
    }

    close_fds();
    emit_lines(out_partial, false, true);
    emit_lines(err_partial, true, true);

    while (!try_reap(result)) {
        if (terminate_requested_ && steady_ms() >= kill_at_ms_) {
            signal_group(SIGKILL);
        }
        sleep_ms(20);
    }
    return result;
}

ProcessResult ProcessHandle::wait_streaming(const LineCallback& on_line) {
    return pump(&on_line, false, {}, false);
}

ProcessResult ProcessHandle::wait_captured(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    return pump(nullptr, true, deadline, timeout_ms > 0);
}

// ── PosixProcessRunner ───────────────────────────────────────

ProcessResult PosixProcessRunner::run(const ProcessSpec& spec, int timeout_ms) {
    ProcessHandle handle(spec);
    return handle.wait_captured(timeout_ms);
}

std::unique_ptr<ChildProcess> PosixProcessRunner::start(const ProcessSpec& spec) {
    return std::make_unique<ProcessHandle>(spec);
}

// ── Foreground ───────────────────────────────────────────────

int run_foreground(const std::string& program, const std::vector<std::string>& args) {
    // The child owns the terminal; Ctrl-C is for it, not for us.
    struct sigaction ignore = {};
    struct sigaction old_int = {};
    struct sigaction old_quit = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int);
    sigaction(SIGQUIT, &ignore, &old_quit);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int code = -1;
    pid_t pid = fork();
    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        execvp(argv[0], argv.data());
        _exit(127);
    }
    if (pid > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        if (WIFEXITED(status)) code = WEXITSTATUS(status);
    }

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGQUIT, &old_quit, nullptr);
    return code;
}

std::string describe(const ProcessSpec& spec) {
    std::string line = spec.program;
    for (const auto& a : spec.args) {
        line += ' ';
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) {
            line += "\"" + a + "\"";
        } else {
            line += a;
        }
    }
    return line;
}

} // namespace platform
