#include "key_setup.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/prompter.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/askpass.hpp>
#include <ssh/command_channel.hpp>
#include <ssh/ssh_args.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;

KeySetup::KeySetup(platform::ProcessRunner& runner, Prompter& prompter,
                   fs::path key_path, int command_timeout_ms)
    : runner_(runner), prompter_(prompter), key_path_(std::move(key_path)),
      command_timeout_ms_(command_timeout_ms) {}

fs::path KeySetup::default_key_path() {
    return platform::home_dir() / ".ssh" / "id_ed25519";
}

std::string KeySetup::install_command(const std::string& public_key) {
    return fmt::format(
        "mkdir -p ~/.ssh && chmod 700 ~/.ssh && "
        "echo \"$(echo {} | base64 -d)\" >> ~/.ssh/authorized_keys && "
        "chmod 600 ~/.ssh/authorized_keys && echo {}",
        shell_quote(base64_encode(public_key)), KEY_INSTALLED_MARKER);
}

void KeySetup::generate_key() {
    std::error_code ec;
    fs::create_directories(key_path_.parent_path(), ec);

    platform::ProcessSpec spec;
    spec.program = KEYGEN_EXE;
    spec.args = {"-t", "ed25519", "-f", key_path_.string(), "-N", ""};
    auto r = runner_.run(spec, KEYGEN_TIMEOUT_SECS * 1000);
    hpcsync_log_cmd("keygen", spec, r);
    if (r.failed()) {
        std::string detail = trimmed(r.stderr_data);
        throw ProcessError(fmt::format("Failed to generate SSH key: {}",
                                       detail.empty() ? "ssh-keygen failed" : detail),
                           r.exit_code, r.stderr_data);
    }
    prompter_.info("SSH key generated: " + key_path_.string());
}

KeySetupResult KeySetup::run(const ConnectionTarget& target) {
    fs::path pub_path = key_path_;
    pub_path += ".pub";

    if (!fs::exists(pub_path)) {
        if (!prompter_.confirm("No SSH key found. Generate a new ed25519 key?")) {
            return KeySetupResult::CANCELLED;
        }
        generate_key();
    }

    std::string public_key;
    {
        std::ifstream in(pub_path);
        if (!in) {
            throw ValidationError("Failed to read public key: " + pub_path.string());
        }
        std::stringstream ss;
        ss << in.rdbuf();
        public_key = trimmed(ss.str());
    }
    if (public_key.empty()) {
        throw ValidationError("Public key is empty: " + pub_path.string());
    }

    if (!prompter_.confirm(fmt::format("Copy SSH public key to {}?", target.destination()))) {
        return KeySetupResult::CANCELLED;
    }

    auto secret = prompter_.secret(fmt::format("Password for {}", target.destination()));
    if (!secret || secret->empty()) {
        return KeySetupResult::CANCELLED;
    }

    // Removed when it goes out of scope, whatever happens below.
    AskpassHelper helper(*secret);
    std::fill(secret->begin(), secret->end(), '\0');

    CommandChannel channel(runner_);
    std::string out = channel.execute(target, install_command(public_key), &helper,
                                      command_timeout_ms_);

    if (out.find(KEY_INSTALLED_MARKER) != std::string::npos) {
        hpcsync_log("keysetup: installed on " + target.key());
        return KeySetupResult::INSTALLED;
    }
    return KeySetupResult::UNVERIFIED;
}
