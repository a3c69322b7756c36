#include "remote_shell.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <ssh/ssh_args.hpp>
#include <fmt/format.h>

int open_remote_shell(const SyncProfile& profile) {
    std::string dir = profile.remote_dir.empty() ? "." : profile.remote_dir;
    auto args = build_shell_args(profile.target, dir);

    platform::ProcessSpec spec{SSH_EXE, args, {}, ""};
    hpcsync_log("shell: " + platform::describe(spec));

    int code = platform::run_foreground(SSH_EXE, args);
    hpcsync_log(fmt::format("shell: exited with {}", code));
    return code;
}
