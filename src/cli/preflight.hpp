#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

class ToolResolver;
class ProfileStore;

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Runs all preflight checks before connecting.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(ToolResolver& tools, const ProfileStore& profiles);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_ssh_client(ToolResolver& tools);
std::vector<PreflightIssue> check_global_config();
std::vector<PreflightIssue> check_profiles(const ProfileStore& profiles);
