#pragma once

#include <string>
#include <map>
#include <filesystem>

// A private executable script that prints one password when ssh runs it as
// SSH_ASKPASS. The secret lives only in this file (base64, mode 0700) and
// the file is removed when the helper is destroyed.
class AskpassHelper {
public:
    // Throws std::runtime_error if the file cannot be created.
    explicit AskpassHelper(const std::string& secret);
    ~AskpassHelper();

    AskpassHelper(const AskpassHelper&) = delete;
    AskpassHelper& operator=(const AskpassHelper&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // SSH_ASKPASS, SSH_ASKPASS_REQUIRE=force, DISPLAY=:0
    std::map<std::string, std::string> environment() const;

private:
    std::filesystem::path path_;
};
