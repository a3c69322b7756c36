#include "ssh_args.hpp"
#include <core/constants.hpp>

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::vector<std::string> ssh_connection_options(const ConnectionTarget& target) {
    std::vector<std::string> args;
    if (target.port) {
        args.push_back("-p");
        args.push_back(std::to_string(*target.port));
    }
    if (!target.identity_file.empty()) {
        args.push_back("-i");
        args.push_back(target.identity_file);
    }
    args.push_back("-o");
    args.push_back(SSH_HOST_KEY_POLICY);
    args.push_back("-o");
    args.push_back(SSH_KEEPALIVE_INTERVAL);
    args.push_back("-o");
    args.push_back(SSH_KEEPALIVE_COUNT);
    return args;
}

std::vector<std::string> build_ssh_args(const ConnectionTarget& target,
                                        const std::string& command,
                                        bool with_credential) {
    auto args = ssh_connection_options(target);
    args.push_back("-o");
    args.push_back(with_credential ? SSH_SINGLE_PROMPT : SSH_BATCH_MODE);
    args.push_back(target.destination());
    args.push_back(command);
    return args;
}

std::vector<std::string> build_shell_args(const ConnectionTarget& target,
                                          const std::string& remote_dir) {
    std::vector<std::string> args;
    if (target.port) {
        args.push_back("-p");
        args.push_back(std::to_string(*target.port));
    }
    if (!target.identity_file.empty()) {
        args.push_back("-i");
        args.push_back(target.identity_file);
    }
    args.push_back("-o");
    args.push_back(SSH_NO_AGENT_FORWARD);
    args.push_back(target.destination());
    args.push_back("-t");
    args.push_back("cd " + shell_quote(remote_dir) + " && exec $SHELL -l");
    return args;
}

std::string rsync_ssh_command(const ConnectionTarget& target, bool with_credential) {
    std::string cmd = SSH_EXE;
    if (target.port) {
        cmd += " -p " + std::to_string(*target.port);
    }
    if (!target.identity_file.empty()) {
        cmd += " -i " + shell_quote(target.identity_file);
    }
    cmd += std::string(" -o ") + SSH_HOST_KEY_POLICY;
    cmd += std::string(" -o ") + (with_credential ? SSH_SINGLE_PROMPT : SSH_BATCH_MODE);
    return cmd;
}

std::vector<std::string> build_scp_options(const ConnectionTarget& target, bool with_credential) {
    std::vector<std::string> args = {"-r"};
    if (target.port) {
        args.push_back("-P");
        args.push_back(std::to_string(*target.port));
    }
    if (!target.identity_file.empty()) {
        args.push_back("-i");
        args.push_back(target.identity_file);
    }
    args.push_back("-o");
    args.push_back(SSH_HOST_KEY_POLICY);
    args.push_back("-o");
    args.push_back(with_credential ? SSH_SINGLE_PROMPT : SSH_BATCH_MODE);
    return args;
}
