#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/process.hpp>

class Prompter;

enum class KeySetupResult {
    INSTALLED,
    UNVERIFIED,             // ssh succeeded but the marker never came back
    CANCELLED,
};

// Generates ~/.ssh/id_ed25519 if needed and appends its public half to the
// target's authorized_keys, logging in once with a password.
class KeySetup {
public:
    KeySetup(platform::ProcessRunner& runner, Prompter& prompter,
             std::filesystem::path key_path = default_key_path(),
             int command_timeout_ms = COMMAND_TIMEOUT_SECS * 1000);

    // Throws ProcessError (keygen), AuthError / ProcessError / TimeoutError (install).
    KeySetupResult run(const ConnectionTarget& target);

    static std::filesystem::path default_key_path();

    // Remote side of the install, exposed for tests.
    static std::string install_command(const std::string& public_key);

private:
    platform::ProcessRunner& runner_;
    Prompter& prompter_;
    std::filesystem::path key_path_;
    int command_timeout_ms_;

    void generate_key();
};
