#pragma once

#include <string>
#include <platform/process.hpp>
#include <core/types.hpp>

class AskpassHelper;

// One-shot remote commands through the external ssh client.
class CommandChannel {
public:
    explicit CommandChannel(platform::ProcessRunner& runner);

    // Runs `command` on the target and returns its stdout.
    // Throws AuthError, TimeoutError or ProcessError (non-zero exit).
    // stdin_data, if any, is piped to the remote command and never logged.
    std::string execute(const ConnectionTarget& target,
                        const std::string& command,
                        const AskpassHelper* credential,
                        int timeout_ms,
                        const std::string& stdin_data = "");

    platform::ProcessRunner& runner() { return runner_; }

private:
    platform::ProcessRunner& runner_;
};

// True if ssh's stderr reports that the server refused our credentials.
bool is_auth_refusal(const std::string& stderr_data);
