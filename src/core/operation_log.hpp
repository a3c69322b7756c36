#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <functional>
#include <core/constants.hpp>

// Line stream shown to the user for sync runs and remote operations.
// Keeps a bounded tail and fans out each line to subscribers.
class OperationLog {
public:
    using Listener = std::function<void(const std::string& line)>;

    explicit OperationLog(size_t max_lines = OPERATION_LOG_MAX_LINES);

    void append_line(const std::string& line);

    // Returns a token for unsubscribe(). Listeners run on the appending thread.
    int subscribe(Listener listener);
    void unsubscribe(int token);

    std::vector<std::string> lines() const;
    void clear();

private:
    size_t max_lines_;
    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
    std::map<int, Listener> listeners_;
    int next_token_ = 1;
};
