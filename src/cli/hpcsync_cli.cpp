#include "hpcsync_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>
#include <readline/readline.h>
#include <readline/history.h>

HpcsyncCLI::HpcsyncCLI() : BaseCLI(STDIN_FILENO, std::cout) {
    register_all_commands();
}

HpcsyncCLI::HpcsyncCLI(int prompt_fd, std::ostream& prompt_out)
    : BaseCLI(prompt_fd, prompt_out, true) {
    register_all_commands();
}

void HpcsyncCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Exit hpcsync");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Exit hpcsync");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_profile_commands(*this);
    register_sync_commands(*this);
    register_connection_commands(*this);
    register_remote_commands(*this);
    register_tool_commands(*this);
}

void HpcsyncCLI::run_repl() {
    std::cout << theme::banner();

    // Preflight
    std::cout << theme::section("Preflight");
    auto issues = run_preflight_checks(tools, profiles);
    bool blocking = false;
    for (const auto& issue : issues) {
        if (issue.is_hint) {
            std::cout << theme::info(issue.message);
        } else {
            std::cout << theme::fail(issue.message);
            blocking = true;
        }
        std::cout << theme::step(issue.fix);
    }
    if (blocking) {
        std::cout << "\n";
        return;
    }
    if (issues.empty()) {
        std::cout << theme::ok("ssh client found");
        std::cout << theme::ok("Active profile: " + profiles.active_name());
    }

    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    explorer.disconnect();
    std::cout << theme::dim("Disconnecting...") << "\n";
}

int HpcsyncCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    std::string args_str;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) args_str += " ";
        args_str += args[i];
    }
    bool ok = execute_command(command, args_str);
    explorer.disconnect();
    return ok ? 0 : 1;
}

int HpcsyncCLI::run_requests(std::istream& in, std::ostream& out) {
    return run_request_loop(*this, in, out);
}
