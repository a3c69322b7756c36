#pragma once

#include <string>
#include <map>
#include <mutex>
#include <platform/process.hpp>
#include <core/constants.hpp>

struct ToolInfo {
    bool available = false;
    std::string path;                       // program to exec
    bool via_compat = false;                // run as `wsl <path> ...`
};

// Finds local transfer tools, once per tool name per resolver.
class ToolResolver {
public:
    ToolResolver(platform::ProcessRunner& runner, bool native_posix,
                 int probe_timeout_ms = TOOL_PROBE_TIMEOUT_SECS * 1000);

    // "rsync", "ssh" or "scp". Unknown names resolve as unavailable.
    ToolInfo resolve(const std::string& tool);

    void clear_cache();

private:
    platform::ProcessRunner& runner_;
    bool native_posix_;
    int probe_timeout_ms_;
    std::mutex mutex_;
    std::map<std::string, ToolInfo> cache_;

    ToolInfo probe(const std::string& tool);
    bool runs_ok(const std::string& program, const std::vector<std::string>& args);
};
