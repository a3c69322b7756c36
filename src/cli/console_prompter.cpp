#include "console_prompter.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <unistd.h>

static constexpr int SECRET_TIMEOUT_MS = 120000;

ConsolePrompter::ConsolePrompter(int in_fd, std::ostream& out, bool owns_fd)
    : in_fd_(in_fd), out_(out), owns_fd_(owns_fd) {}

ConsolePrompter::~ConsolePrompter() {
    if (owns_fd_ && in_fd_ >= 0) close(in_fd_);
}

std::optional<std::string> ConsolePrompter::secret(const std::string& prompt) {
    if (in_fd_ < 0) return std::nullopt;

    out_ << theme::color::BROWN << "    " << prompt << ": " << theme::color::RESET;
    out_.flush();

    std::string value;
    bool ok = platform::is_tty(in_fd_)
        ? platform::read_hidden_line(in_fd_, value, SECRET_TIMEOUT_MS)
        : platform::read_line(in_fd_, value);
    out_ << "\n";
    if (!ok || value.empty()) return std::nullopt;
    return value;
}

std::optional<std::string> ConsolePrompter::line(const std::string& prompt,
                                                 const std::string& default_value) {
    if (in_fd_ < 0) return std::nullopt;

    std::string suffix = default_value.empty() ? ": " : " [" + default_value + "]: ";
    out_ << theme::color::BROWN << "    " << prompt << suffix << theme::color::RESET;
    out_.flush();

    std::string answer;
    if (!platform::read_line(in_fd_, answer)) return std::nullopt;
    if (trimmed(answer).empty()) return default_value;
    return answer;
}

bool ConsolePrompter::confirm(const std::string& question) {
    if (in_fd_ < 0) return false;

    out_ << theme::color::BROWN << "    " << question << " (y/N): " << theme::color::RESET;
    out_.flush();

    std::string answer;
    if (!platform::read_line(in_fd_, answer)) return false;
    answer = trimmed(answer);
    return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

std::optional<size_t> ConsolePrompter::choose(const std::string& title,
                                              const std::vector<std::string>& options) {
    if (in_fd_ < 0 || options.empty()) return std::nullopt;

    out_ << "\n" << theme::dim("    " + title) << "\n";
    for (size_t i = 0; i < options.size(); i++) {
        out_ << theme::color::BROWN << "      " << (i + 1) << theme::color::RESET
             << "  " << options[i] << "\n";
    }

    while (true) {
        out_ << theme::color::BROWN << "    Choice (Enter to cancel): " << theme::color::RESET;
        out_.flush();

        std::string answer;
        if (!platform::read_line(in_fd_, answer)) return std::nullopt;
        answer = trimmed(answer);
        if (answer.empty()) return std::nullopt;

        int n = safe_stoi(answer, 0);
        if (n >= 1 && n <= static_cast<int>(options.size())) {
            return static_cast<size_t>(n - 1);
        }
        out_ << theme::fail("Pick a number between 1 and " + std::to_string(options.size()));
    }
}

void ConsolePrompter::info(const std::string& msg) {
    out_ << theme::info(msg);
}

void ConsolePrompter::warn(const std::string& msg) {
    out_ << theme::warn(msg);
}

void ConsolePrompter::error(const std::string& msg) {
    out_ << theme::fail(msg);
}
