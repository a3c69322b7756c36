#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>
#include <iostream>

// Forward declarations for command registration
void register_profile_commands(BaseCLI& cli);
void register_sync_commands(BaseCLI& cli);
void register_connection_commands(BaseCLI& cli);
void register_remote_commands(BaseCLI& cli);
void register_tool_commands(BaseCLI& cli);

// Interactive profile editor. Starts from `base` when given (editing an
// existing profile). Returns nullopt if the user cancelled.
std::optional<SyncProfile> run_profile_wizard(BaseCLI& cli, const std::string& name,
                                              const SyncProfile* base = nullptr);

// Line-oriented request loop for editor frontends. Returns the exit code.
int run_request_loop(BaseCLI& cli, std::istream& in, std::ostream& out);

class HpcsyncCLI : public BaseCLI {
public:
    HpcsyncCLI();
    // Prompts go to prompt_fd/prompt_out instead of the terminal (request mode).
    HpcsyncCLI(int prompt_fd, std::ostream& prompt_out);

    void run_repl();
    int run_command(const std::string& command, const std::vector<std::string>& args);
    int run_requests(std::istream& in, std::ostream& out);

private:
    void register_all_commands();
    bool quit_requested_ = false;
};
