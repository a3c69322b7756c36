#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Single-quote s for a POSIX shell: ' becomes '\''.
std::string shell_quote(const std::string& s);

// [-p port] [-i identity] -o StrictHostKeyChecking=accept-new
// -o ServerAliveInterval=60 -o ServerAliveCountMax=60
std::vector<std::string> ssh_connection_options(const ConnectionTarget& target);

// Full ssh argv (without the program) for a one-shot remote command.
// Without a credential BatchMode=yes goes in before the destination so a
// key failure fails fast instead of prompting.
std::vector<std::string> build_ssh_args(const ConnectionTarget& target,
                                        const std::string& command,
                                        bool with_credential);

// Interactive login shell in remote_dir: needs a tty, no agent forwarding.
std::vector<std::string> build_shell_args(const ConnectionTarget& target,
                                          const std::string& remote_dir);

// Value for rsync's -e: "ssh [-p N] [-i 'id'] -o StrictHostKeyChecking=accept-new ..."
std::string rsync_ssh_command(const ConnectionTarget& target, bool with_credential);

// scp flags: -r [-P port] [-i identity] -o StrictHostKeyChecking=accept-new [-o BatchMode=yes]
std::vector<std::string> build_scp_options(const ConnectionTarget& target, bool with_credential);
