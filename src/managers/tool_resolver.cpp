#include "tool_resolver.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ToolResolver::ToolResolver(platform::ProcessRunner& runner, bool native_posix,
                           int probe_timeout_ms)
    : runner_(runner), native_posix_(native_posix), probe_timeout_ms_(probe_timeout_ms) {}

ToolInfo ToolResolver::resolve(const std::string& tool) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(tool);
    if (it != cache_.end()) return it->second;

    ToolInfo info = probe(tool);
    hpcsync_log(fmt::format("tools: {} -> {}{}", tool,
                            info.available ? info.path : "not found",
                            info.via_compat ? " (compat)" : ""));
    cache_[tool] = info;
    return info;
}

void ToolResolver::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

bool ToolResolver::runs_ok(const std::string& program, const std::vector<std::string>& args) {
    platform::ProcessSpec spec;
    spec.program = program;
    spec.args = args;
    auto r = runner_.run(spec, probe_timeout_ms_);
    hpcsync_log_cmd("probe", spec, r);
    return r.success();
}

ToolInfo ToolResolver::probe(const std::string& tool) {
    ToolInfo info;

    if (tool == RSYNC_EXE) {
        if (runs_ok(RSYNC_EXE, {"--version"})) {
            info = {true, RSYNC_EXE, false};
        } else if (!native_posix_) {
            if (runs_ok(BUNDLED_RSYNC_PATH, {"--version"})) {
                info = {true, BUNDLED_RSYNC_PATH, false};
            } else if (runs_ok(COMPAT_LAYER_EXE, {RSYNC_EXE, "--version"})) {
                info = {true, RSYNC_EXE, true};
            }
        }
    } else if (tool == SSH_EXE) {
        if (runs_ok(SSH_EXE, {"-V"})) {
            info = {true, SSH_EXE, false};
        }
    } else if (tool == SCP_EXE) {
        // scp has no --version; with no arguments it exits non-zero, but it ran.
        platform::ProcessSpec spec;
        spec.program = SCP_EXE;
        auto r = runner_.run(spec, probe_timeout_ms_);
        hpcsync_log_cmd("probe", spec, r);
        if (!r.spawn_failed) {
            info = {true, SCP_EXE, false};
        }
    }
    return info;
}
