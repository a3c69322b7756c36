#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <signal.h>

namespace platform {

// While alive, Ctrl-C (SIGINT) does not kill the process; it calls
// on_interrupt from a watcher thread instead. Used to turn Ctrl-C during
// a transfer into a cancel request.
//
// Must be constructed on the thread that runs the blocking work, before
// any other threads are started, so they all inherit the blocked mask.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::function<void()> on_interrupt);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    bool interrupted() const { return interrupted_; }

private:
    std::function<void()> on_interrupt_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> interrupted_{false};
    std::thread watcher_;
    bool mask_saved_ = false;
    sigset_t old_mask_;

    void watch();
};

} // namespace platform
