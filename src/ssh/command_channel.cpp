#include "command_channel.hpp"
#include "askpass.hpp"
#include "ssh_args.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

bool is_auth_refusal(const std::string& stderr_data) {
    static const char* patterns[] = {
        "Permission denied",
        "Authentication failed",
        "Too many authentication failures",
        "No more authentication methods",
        "no more authentication methods",
    };
    for (const char* p : patterns) {
        if (stderr_data.find(p) != std::string::npos) return true;
    }
    return false;
}

CommandChannel::CommandChannel(platform::ProcessRunner& runner) : runner_(runner) {}

std::string CommandChannel::execute(const ConnectionTarget& target,
                                    const std::string& command,
                                    const AskpassHelper* credential,
                                    int timeout_ms,
                                    const std::string& stdin_data) {
    platform::ProcessSpec spec;
    spec.program = SSH_EXE;
    spec.args = build_ssh_args(target, command, credential != nullptr);
    if (credential) {
        spec.env = credential->environment();
    }
    spec.stdin_data = stdin_data;

    auto r = runner_.run(spec, timeout_ms);
    hpcsync_log_cmd("ssh", spec, r);

    if (r.spawn_failed) {
        throw ProcessError(fmt::format("Failed to start ssh: {}", trimmed(r.stderr_data)),
                           r.exit_code, r.stderr_data);
    }
    if (r.timed_out) {
        throw TimeoutError(fmt::format("Command on {} timed out after {}s",
                                       target.destination(), timeout_ms / 1000));
    }
    if (r.exit_code == 255 && is_auth_refusal(r.stderr_data)) {
        throw AuthError(trimmed(r.stderr_data));
    }
    if (r.exit_code != 0) {
        std::string detail = trimmed(r.stderr_data);
        if (detail.empty()) detail = fmt::format("ssh exited with code {}", r.exit_code);
        throw ProcessError(detail, r.exit_code, r.stderr_data);
    }
    return r.stdout_data;
}
