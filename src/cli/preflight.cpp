#include "preflight.hpp"
#include <core/config.hpp>
#include <managers/tool_resolver.hpp>
#include <filesystem>
#include <fmt/format.h>

std::vector<PreflightIssue> check_ssh_client(ToolResolver& tools) {
    std::vector<PreflightIssue> issues;
    if (!tools.resolve(SSH_EXE).available) {
        issues.push_back({"No ssh client found on PATH",
                          "Install OpenSSH (openssh-client) and try again"});
    }
    return issues;
}

std::vector<PreflightIssue> check_global_config() {
    std::vector<PreflightIssue> issues;

    if (!std::filesystem::exists(get_global_config_path())) {
        return issues;  // written with defaults on first load
    }

    auto result = GlobalConfig::load_from(get_global_config_path());
    if (result.is_err()) {
        issues.push_back({"Failed to parse global config: " + result.error,
                          "Check YAML syntax in " + get_global_config_path().string()});
    }
    return issues;
}

std::vector<PreflightIssue> check_profiles(const ProfileStore& profiles) {
    std::vector<PreflightIssue> issues;

    auto loaded = profiles.load();
    if (loaded.is_err()) {
        issues.push_back({"Failed to read profiles: " + loaded.error,
                          "Fix or remove " + profiles.path().string()});
        return issues;
    }

    if (loaded.value.empty()) {
        issues.push_back({"No sync profiles yet", "Run 'new <name>' to create one", true});
        return issues;
    }

    if (profiles.active_name().empty()) {
        issues.push_back({"No active profile", "Run 'use <name>' to pick one", true});
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(ToolResolver& tools, const ProfileStore& profiles) {
    std::vector<PreflightIssue> all;

    auto ssh_issues = check_ssh_client(tools);
    all.insert(all.end(), ssh_issues.begin(), ssh_issues.end());

    auto config_issues = check_global_config();
    all.insert(all.end(), config_issues.begin(), config_issues.end());

    auto profile_issues = check_profiles(profiles);
    all.insert(all.end(), profile_issues.begin(), profile_issues.end());

    return all;
}
