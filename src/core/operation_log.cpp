#include "operation_log.hpp"
#include "log.hpp"

OperationLog::OperationLog(size_t max_lines) : max_lines_(max_lines) {}

void OperationLog::append_line(const std::string& line) {
    std::vector<Listener> to_notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(line);
        while (lines_.size() > max_lines_) lines_.pop_front();
        for (const auto& [token, listener] : listeners_) {
            to_notify.push_back(listener);
        }
    }
    hpcsync_log("[oplog] " + line);

    // Outside the lock so a listener may read lines() back.
    for (const auto& listener : to_notify) {
        listener(line);
    }
}

int OperationLog::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

void OperationLog::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(token);
}

std::vector<std::string> OperationLog::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

void OperationLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}
