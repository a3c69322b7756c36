#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>

namespace platform {

bool is_tty(int fd) {
    return fd >= 0 && isatty(fd) == 1;
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard(int fd) : fd_(fd) {
    if (!is_tty(fd_)) return;
    impl_ = new Impl;
    tcgetattr(fd_, &impl_->old_term);
    struct termios raw = impl_->old_term;
    // Canonical off, echo off. ISIG stays on so Ctrl-C still interrupts.
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(fd_, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(fd_, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── Line input ───────────────────────────────────────────────

bool poll_fd(int fd, int timeout_ms) {
    struct pollfd pfd = {fd, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

bool read_line(int fd, std::string& out) {
    out.clear();
    while (true) {
        char c;
        ssize_t n = read(fd, &c, 1);
        if (n < 0 && errno == EINTR) continue;
        if (n != 1) return !out.empty();
        if (c == '\n') break;
        out += c;
    }
    if (!out.empty() && out.back() == '\r') out.pop_back();
    return true;
}

bool read_hidden_line(int fd, std::string& out, int timeout_ms) {
    RawModeGuard guard(fd);
    out.clear();
    while (true) {
        if (!poll_fd(fd, timeout_ms)) return false;
        char c;
        if (read(fd, &c, 1) != 1) return false;
        if (c == '\n' || c == '\r') return true;
        if (c == 127 || c == 8) {  // backspace
            if (!out.empty()) out.pop_back();
            continue;
        }
        if (c == 3 || c == 4) return false;  // ^C / ^D
        if (static_cast<unsigned char>(c) >= 32) out += c;
    }
}

} // namespace platform
