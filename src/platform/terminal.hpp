#pragma once

#include <string>

namespace platform {

// True when fd is attached to a terminal (prompts are possible).
bool is_tty(int fd);

// RAII guard that turns off echo and canonical mode on fd.
// Destructor restores the saved mode. No-op when fd is not a tty.
struct RawModeGuard {
    explicit RawModeGuard(int fd);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    struct Impl;
    int fd_;
    Impl* impl_ = nullptr;
};

// Poll fd for readability with a timeout.
bool poll_fd(int fd, int timeout_ms);

// Read one line from fd, unbuffered, so it can share the descriptor with
// readline. Returns false on EOF before any newline.
bool read_line(int fd, std::string& out);

// Read one line from fd without echo. Backspace edits, Enter ends.
// Returns false on timeout or EOF before any Enter.
bool read_hidden_line(int fd, std::string& out, int timeout_ms);

} // namespace platform
