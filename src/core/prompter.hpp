#pragma once

#include <string>
#include <vector>
#include <optional>

// User interaction seam. The console implementation lives in cli/; tests
// script it. Every method blocks the calling operation until answered.
class Prompter {
public:
    virtual ~Prompter() = default;

    // Masked input. nullopt = cancelled.
    virtual std::optional<std::string> secret(const std::string& prompt) = 0;

    // Plain input. A blank answer gives default_value; nullopt = cancelled (EOF).
    virtual std::optional<std::string> line(const std::string& prompt,
                                            const std::string& default_value = "") = 0;

    // Modal yes/no. Anything but an explicit yes is a no.
    virtual bool confirm(const std::string& question) = 0;

    // Pick one of options. nullopt = cancelled.
    virtual std::optional<size_t> choose(const std::string& title,
                                         const std::vector<std::string>& options) = 0;

    virtual void info(const std::string& msg) = 0;
    virtual void warn(const std::string& msg) = 0;
    virtual void error(const std::string& msg) = 0;
};
