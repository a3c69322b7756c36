#include "base_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

static GlobalConfig load_config_or_defaults() {
    auto config_result = GlobalConfig::load();
    if (config_result.is_ok()) {
        return config_result.value;
    }
    // stderr: stdout carries responses in request mode
    std::cerr << theme::fail(config_result.error);
    std::cerr << theme::step("Using built-in defaults.");
    return GlobalConfig{};
}

BaseCLI::BaseCLI(int prompt_fd, std::ostream& prompt_out, bool owns_prompt_fd)
    : config(load_config_or_defaults()),
      prompter(prompt_fd, prompt_out, owns_prompt_fd),
      channel(runner),
      tools(runner, platform::has_native_posix(), config.probe_timeout * 1000),
      explorer(channel, prompter, timeouts()),
      sync(runner, tools, prompter, oplog, config.command_timeout * 1000) {}

RemoteSession::Timeouts BaseCLI::timeouts() const {
    RemoteSession::Timeouts t;
    t.command_ms = config.command_timeout * 1000;
    t.transfer_ms = config.transfer_timeout * 1000;
    return t;
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

std::optional<SyncProfile> BaseCLI::resolve_profile(const std::string& name) {
    auto result = name.empty() ? profiles.active() : profiles.get(name);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return std::nullopt;
    }
    return result.value;
}

bool BaseCLI::ensure_connected(const SyncProfile& profile) {
    if (explorer.connected() && explorer.profile() &&
        explorer.profile()->name == profile.name) {
        return true;
    }

    auto issues = check_ssh_client(tools);
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            std::cout << theme::fail(issue.message);
            std::cout << theme::step(issue.fix);
        }
        return false;
    }

    std::cout << theme::step(fmt::format("Connecting to {}...", profile.target.destination()));
    try {
        explorer.connect(profile);
    } catch (const RemoteError& e) {
        std::cout << theme::fail(fmt::format("Connection failed: {}", e.what()));
        return false;
    }
    std::cout << theme::ok("Connected to " + profile.target.destination());
    return true;
}

bool BaseCLI::require_connection() {
    if (explorer.connected()) {
        return true;
    }
    auto profile = resolve_profile();
    if (!profile) {
        return false;
    }
    return ensure_connected(*profile);
}

bool BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return false;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return false;
    }
    return true;
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Profiles", {"profiles", "use", "new", "delete"}},
        {"Sync",     {"push", "dryrun"}},
        {"Remote",   {"connect", "disconnect", "ls", "tree", "stat", "cat", "get", "put",
                      "refresh", "mkdir", "rm", "mv"}},
        {"Tools",    {"browse", "shell", "keysetup", "tools", "log"}},
        {"General",  {"status", "help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string active = profiles.active_name();
    if (active.empty()) {
        return rl_esc(theme::color::BROWN) + "hpcsync"
             + rl_esc(theme::color::RESET) + "> ";
    } else if (explorer.connected() && explorer.profile()) {
        return rl_esc(theme::color::BROWN) + "hpcsync"
             + rl_esc(theme::color::RESET) + ":"
             + rl_esc(theme::color::BLUE) + explorer.profile()->name
             + rl_esc(theme::color::RESET) + "@"
             + rl_esc(theme::color::GREEN) + explorer.profile()->target.host
             + rl_esc(theme::color::RESET) + "> ";
    } else {
        return rl_esc(theme::color::BROWN) + "hpcsync"
             + rl_esc(theme::color::RESET) + ":"
             + rl_esc(theme::color::BLUE) + active
             + rl_esc(theme::color::RESET) + "> ";
    }
}
