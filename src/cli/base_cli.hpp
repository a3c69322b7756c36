#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <iostream>
#include <core/config.hpp>
#include <core/operation_log.hpp>
#include <platform/process.hpp>
#include <ssh/command_channel.hpp>
#include <managers/tool_resolver.hpp>
#include <managers/remote_explorer.hpp>
#include <managers/sync_engine.hpp>
#include "console_prompter.hpp"

class BaseCLI {
public:
    // Prompts read from prompt_fd and print to prompt_out.
    BaseCLI(int prompt_fd, std::ostream& prompt_out, bool owns_prompt_fd = false);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Named profile, or the active one when name is empty. Prints on failure.
    std::optional<SyncProfile> resolve_profile(const std::string& name = "");

    // Connect the explorer to profile unless it already is. Prints on failure.
    bool ensure_connected(const SyncProfile& profile);

    // Connect to the active profile if nothing is connected yet.
    bool require_connection();

    // False when the command is unknown or its handler threw.
    bool execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    RemoteSession::Timeouts timeouts() const;

    // Public state
    GlobalConfig config;
    ProfileStore profiles;
    OperationLog oplog;
    platform::PosixProcessRunner runner;
    ConsolePrompter prompter;
    CommandChannel channel;
    ToolResolver tools;
    RemoteExplorer explorer;
    SyncEngine sync;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
