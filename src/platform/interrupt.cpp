#include "interrupt.hpp"

#include <signal.h>
#include <ctime>

namespace platform {

InterruptWatcher::InterruptWatcher(std::function<void()> on_interrupt)
    : on_interrupt_(std::move(on_interrupt)) {
    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGINT);
    mask_saved_ = pthread_sigmask(SIG_BLOCK, &block, &old_mask_) == 0;
    watcher_ = std::thread([this] { watch(); });
}

InterruptWatcher::~InterruptWatcher() {
    stop_ = true;
    if (watcher_.joinable()) watcher_.join();

    // Swallow a Ctrl-C that arrived after the watcher stopped so it does
    // not kill the REPL once the mask is restored.
    sigset_t only_int;
    sigemptyset(&only_int);
    sigaddset(&only_int, SIGINT);
    struct timespec zero = {0, 0};
    while (sigtimedwait(&only_int, nullptr, &zero) == SIGINT) {}

    if (mask_saved_) {
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }
}

void InterruptWatcher::watch() {
    sigset_t only_int;
    sigemptyset(&only_int);
    sigaddset(&only_int, SIGINT);
    struct timespec tick = {0, 100 * 1000 * 1000};

    while (!stop_) {
        if (sigtimedwait(&only_int, nullptr, &tick) == SIGINT) {
            interrupted_ = true;
            if (on_interrupt_) on_interrupt_();
        }
    }
}

} // namespace platform
