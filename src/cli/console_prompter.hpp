#pragma once

#include <core/prompter.hpp>
#include <iostream>

// Prompter on a terminal. Reads from in_fd, writes to out.
// With in_fd < 0 every question is answered with "cancel".
class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(int in_fd, std::ostream& out, bool owns_fd = false);
    ~ConsolePrompter() override;

    ConsolePrompter(const ConsolePrompter&) = delete;
    ConsolePrompter& operator=(const ConsolePrompter&) = delete;

    std::optional<std::string> secret(const std::string& prompt) override;
    std::optional<std::string> line(const std::string& prompt,
                                    const std::string& default_value = "") override;
    bool confirm(const std::string& question) override;
    std::optional<size_t> choose(const std::string& title,
                                 const std::vector<std::string>& options) override;

    void info(const std::string& msg) override;
    void warn(const std::string& msg) override;
    void error(const std::string& msg) override;

private:
    int in_fd_;
    std::ostream& out_;
    bool owns_fd_;
};
