#include <iostream>
#include <vector>
#include <string>
#include <fcntl.h>
#include "cli/hpcsync_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    hpcsync"
              << theme::color::RESET << theme::color::DIM
              << "                          Interactive shell" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hpcsync push "
              << theme::color::RESET << theme::color::BROWN << "[--dry-run] [profile]"
              << theme::color::RESET << theme::color::DIM
              << "  Push local files to the remote dir" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hpcsync browse "
              << theme::color::RESET << theme::color::BROWN << "[profile]"
              << theme::color::RESET << theme::color::DIM
              << "         Pick a remote directory" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hpcsync shell "
              << theme::color::RESET << theme::color::BROWN << "[profile]"
              << theme::color::RESET << theme::color::DIM
              << "          Open a remote login shell" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hpcsync keysetup "
              << theme::color::RESET << theme::color::BROWN << "[profile]"
              << theme::color::RESET << theme::color::DIM
              << "       Install an SSH key on the host" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hpcsync request"
              << theme::color::RESET << theme::color::DIM
              << "                  Line protocol for editor frontends" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    hpcsync --version                Show version\n"
              << "    hpcsync --help                   Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            HpcsyncCLI cli;
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "hpcsync"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << theme::VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        } else if (cmd == "request") {
            // stdout carries responses, so prompts use the controlling terminal.
            int tty = open("/dev/tty", O_RDWR | O_CLOEXEC);
            HpcsyncCLI cli(tty, std::cerr);
            return cli.run_requests(std::cin, std::cout);
        } else if (cmd == "push" || cmd == "browse" || cmd == "shell" || cmd == "keysetup") {
            HpcsyncCLI cli;
            return cli.run_command(cmd, args);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
