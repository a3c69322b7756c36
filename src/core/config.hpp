#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Global settings from ~/.hpcsync/config.yaml. Timeouts are in seconds.
struct GlobalConfig {
    int command_timeout = COMMAND_TIMEOUT_SECS;
    int transfer_timeout = TRANSFER_TIMEOUT_SECS;
    int probe_timeout = TOOL_PROBE_TIMEOUT_SECS;
    int remote_tree_depth = DEFAULT_TREE_DEPTH;
    bool confirm_delete = true;

    // Load ~/.hpcsync/config.yaml, writing the defaults first if it is missing.
    static Result<GlobalConfig> load();
    static Result<GlobalConfig> load_from(const fs::path& path);
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_profiles_path();

// Create default global config
Result<void> create_default_global_config(const fs::path& path = get_global_config_path());

// ── Profiles ────────────────────────────────────────────────

const std::vector<std::string>& default_exclude_patterns();

const char* to_string(SyncMode mode);
std::optional<SyncMode> parse_sync_mode(const std::string& s);

// Host, user and port as they will reach the ssh command line. A host or
// user that starts with '-' or holds whitespace or control characters is
// rejected so it cannot be read as an option.
Result<void> validate_target(const ConnectionTarget& target);

// Field-level checks shared by the store and the request interface.
Result<void> validate_profile(const SyncProfile& profile);

Result<SyncProfile> parse_profile(const YAML::Node& node);
void emit_profile(YAML::Emitter& out, const SyncProfile& profile);

// ~/.hpcsync/profiles.yaml: a list of profiles plus the active name.
class ProfileStore {
public:
    explicit ProfileStore(fs::path path = get_profiles_path());

    Result<std::vector<SyncProfile>> load() const;
    Result<SyncProfile> get(const std::string& name) const;

    // Insert, or replace the profile with the same name.
    Result<void> save_profile(const SyncProfile& profile);
    Result<void> remove_profile(const std::string& name);

    Result<SyncProfile> active() const;
    std::string active_name() const;
    Result<void> set_active(const std::string& name);

    const fs::path& path() const { return path_; }

private:
    struct Document {
        std::vector<SyncProfile> profiles;
        std::string active;
    };

    fs::path path_;

    Result<Document> read() const;
    Result<void> write(const Document& doc) const;
};
