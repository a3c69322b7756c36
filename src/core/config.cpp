#include "config.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace fs = std::filesystem;

// ── Global config ───────────────────────────────────────────

fs::path get_global_config_dir() {
    return platform::app_dir();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_profiles_path() {
    return get_global_config_dir() / "profiles.yaml";
}

Result<void> create_default_global_config(const fs::path& path) {
    std::string default_config = fmt::format(R"(# hpcsync global settings (seconds)
command_timeout: {}
transfer_timeout: {}
probe_timeout: {}
remote_tree_depth: {}
confirm_delete: true
)", COMMAND_TIMEOUT_SECS, TRANSFER_TIMEOUT_SECS, TOOL_PROBE_TIMEOUT_SECS, DEFAULT_TREE_DEPTH);

    try {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static int positive_or(const YAML::Node& node, int fallback) {
    int v = node.as<int>(fallback);
    return v > 0 ? v : fallback;
}

Result<GlobalConfig> GlobalConfig::load_from(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());

        GlobalConfig config;
        config.command_timeout = positive_or(root["command_timeout"], COMMAND_TIMEOUT_SECS);
        config.transfer_timeout = positive_or(root["transfer_timeout"], TRANSFER_TIMEOUT_SECS);
        config.probe_timeout = positive_or(root["probe_timeout"], TOOL_PROBE_TIMEOUT_SECS);
        config.remote_tree_depth = positive_or(root["remote_tree_depth"], DEFAULT_TREE_DEPTH);
        config.confirm_delete = root["confirm_delete"].as<bool>(true);
        return Result<GlobalConfig>::Ok(config);
    } catch (const std::exception& e) {
        return Result<GlobalConfig>::Err(std::string("Failed to parse global config: ") + e.what());
    }
}

Result<GlobalConfig> GlobalConfig::load() {
    fs::path path = get_global_config_path();
    if (!fs::exists(path)) {
        auto created = create_default_global_config(path);
        if (created.is_err()) {
            return Result<GlobalConfig>::Err(created.error);
        }
    }
    return load_from(path);
}

// ── Profile fields ──────────────────────────────────────────

const std::vector<std::string>& default_exclude_patterns() {
    static const std::vector<std::string> patterns = {
        ".git", "node_modules", "__pycache__", ".venv",
    };
    return patterns;
}

const char* to_string(SyncMode mode) {
    switch (mode) {
        case SyncMode::PUSH: return "push";
        case SyncMode::PULL: return "pull";
        case SyncMode::BOTH: return "both";
    }
    return "push";
}

std::optional<SyncMode> parse_sync_mode(const std::string& s) {
    if (s == "push") return SyncMode::PUSH;
    if (s == "pull") return SyncMode::PULL;
    if (s == "both") return SyncMode::BOTH;
    return std::nullopt;
}

static bool is_plain_ssh_word(const std::string& s) {
    if (s.empty() || s[0] == '-') return false;
    for (unsigned char c : s) {
        if (std::isspace(c) || std::iscntrl(c)) return false;
    }
    return true;
}

Result<void> validate_target(const ConnectionTarget& t) {
    if (trimmed(t.host).empty()) {
        return Result<void>::Err("host is required");
    }
    if (!is_plain_ssh_word(t.host)) {
        return Result<void>::Err(fmt::format(
            "invalid host '{}': must not start with '-' or contain whitespace", t.host));
    }
    if (!t.user.empty() && !is_plain_ssh_word(t.user)) {
        return Result<void>::Err(fmt::format(
            "invalid user '{}': must not start with '-' or contain whitespace", t.user));
    }
    if (t.port && (*t.port < 1 || *t.port > 65535)) {
        return Result<void>::Err("port must be 1-65535");
    }
    return Result<void>::Ok();
}

Result<void> validate_profile(const SyncProfile& p) {
    if (p.name.empty()) {
        return Result<void>::Err("Profile name is required");
    }
    auto target = validate_target(p.target);
    if (target.is_err()) {
        return Result<void>::Err(fmt::format("Profile '{}': {}", p.name, target.error));
    }
    if (p.remote_dir == "/") {
        return Result<void>::Err(fmt::format("Profile '{}': remote dir cannot be /", p.name));
    }
    if (p.remote_tree_depth < 1) {
        return Result<void>::Err(fmt::format("Profile '{}': remote_tree_depth must be >= 1", p.name));
    }
    return Result<void>::Ok();
}

Result<SyncProfile> parse_profile(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        return Result<SyncProfile>::Err("Profile must be a mapping");
    }

    try {
        SyncProfile p;
        p.name = node["name"].as<std::string>("");
        p.target.host = node["host"].as<std::string>("");
        p.target.user = node["user"].as<std::string>("");
        p.target.identity_file = node["identity_file"].as<std::string>("");
        if (node["port"] && !node["port"].IsNull()) {
            p.target.port = node["port"].as<int>();
        }
        p.local_dir = node["local_dir"].as<std::string>("");
        p.remote_dir = node["remote_dir"].as<std::string>("");

        std::string mode = node["sync_mode"].as<std::string>("push");
        auto parsed = parse_sync_mode(mode);
        if (!parsed) {
            return Result<SyncProfile>::Err(fmt::format("Unknown sync_mode '{}'", mode));
        }
        p.sync_mode = *parsed;

        if (node["exclude"]) {
            p.exclude_patterns = node["exclude"].as<std::vector<std::string>>();
        } else {
            p.exclude_patterns = default_exclude_patterns();
        }
        p.delete_on_sync = node["delete_on_sync"].as<bool>(false);
        p.remote_tree_root = node["remote_tree_root"].as<std::string>("");
        p.remote_tree_depth = node["remote_tree_depth"].as<int>(DEFAULT_TREE_DEPTH);
        p.remote_files_editable = node["remote_files_editable"].as<bool>(false);

        auto valid = validate_profile(p);
        if (valid.is_err()) {
            return Result<SyncProfile>::Err(valid.error);
        }
        return Result<SyncProfile>::Ok(p);
    } catch (const YAML::Exception& e) {
        return Result<SyncProfile>::Err(std::string("Invalid profile: ") + e.what());
    }
}

void emit_profile(YAML::Emitter& out, const SyncProfile& p) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << p.name;
    out << YAML::Key << "host" << YAML::Value << p.target.host;
    if (!p.target.user.empty())
        out << YAML::Key << "user" << YAML::Value << p.target.user;
    if (p.target.port)
        out << YAML::Key << "port" << YAML::Value << *p.target.port;
    if (!p.target.identity_file.empty())
        out << YAML::Key << "identity_file" << YAML::Value << p.target.identity_file;
    out << YAML::Key << "local_dir" << YAML::Value << p.local_dir;
    out << YAML::Key << "remote_dir" << YAML::Value << p.remote_dir;
    out << YAML::Key << "sync_mode" << YAML::Value << to_string(p.sync_mode);
    out << YAML::Key << "exclude" << YAML::Value << YAML::Flow << p.exclude_patterns;
    out << YAML::Key << "delete_on_sync" << YAML::Value << p.delete_on_sync;
    if (!p.remote_tree_root.empty())
        out << YAML::Key << "remote_tree_root" << YAML::Value << p.remote_tree_root;
    out << YAML::Key << "remote_tree_depth" << YAML::Value << p.remote_tree_depth;
    out << YAML::Key << "remote_files_editable" << YAML::Value << p.remote_files_editable;
    out << YAML::EndMap;
}

// ── ProfileStore ────────────────────────────────────────────

ProfileStore::ProfileStore(fs::path path) : path_(std::move(path)) {}

Result<ProfileStore::Document> ProfileStore::read() const {
    Document doc;
    if (!fs::exists(path_)) {
        return Result<Document>::Ok(doc);
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        doc.active = root["active"].as<std::string>("");

        if (root["profiles"] && root["profiles"].IsSequence()) {
            for (const auto& n : root["profiles"]) {
                auto parsed = parse_profile(n);
                if (parsed.is_err()) {
                    return Result<Document>::Err(
                        fmt::format("{}: {}", path_.string(), parsed.error));
                }
                doc.profiles.push_back(parsed.value);
            }
        }
        return Result<Document>::Ok(doc);
    } catch (const std::exception& e) {
        return Result<Document>::Err(
            fmt::format("Failed to parse {}: {}", path_.string(), e.what()));
    }
}

Result<void> ProfileStore::write(const Document& doc) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "active" << YAML::Value << doc.active;
    out << YAML::Key << "profiles" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : doc.profiles) {
        emit_profile(out, p);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    try {
        fs::create_directories(path_.parent_path());
        fs::path tmp = path_;
        tmp += ".tmp";
        {
            std::ofstream f(tmp);
            if (!f) {
                return Result<void>::Err("Failed to write " + tmp.string());
            }
            f << out.c_str() << "\n";
        }
        fs::rename(tmp, path_);
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to save profiles: " + std::string(e.what()));
    }
}

Result<std::vector<SyncProfile>> ProfileStore::load() const {
    auto doc = read();
    if (doc.is_err()) return Result<std::vector<SyncProfile>>::Err(doc.error);
    return Result<std::vector<SyncProfile>>::Ok(doc.value.profiles);
}

Result<SyncProfile> ProfileStore::get(const std::string& name) const {
    auto doc = read();
    if (doc.is_err()) return Result<SyncProfile>::Err(doc.error);
    for (const auto& p : doc.value.profiles) {
        if (p.name == name) return Result<SyncProfile>::Ok(p);
    }
    return Result<SyncProfile>::Err("No profile named '" + name + "'");
}

Result<void> ProfileStore::save_profile(const SyncProfile& profile) {
    auto valid = validate_profile(profile);
    if (valid.is_err()) return valid;

    auto doc = read();
    if (doc.is_err()) return Result<void>::Err(doc.error);

    auto& profiles = doc.value.profiles;
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [&](const SyncProfile& p) { return p.name == profile.name; });
    if (it != profiles.end()) {
        *it = profile;
    } else {
        profiles.push_back(profile);
    }
    if (doc.value.active.empty()) {
        doc.value.active = profile.name;
    }
    return write(doc.value);
}

Result<void> ProfileStore::remove_profile(const std::string& name) {
    auto doc = read();
    if (doc.is_err()) return Result<void>::Err(doc.error);

    auto& profiles = doc.value.profiles;
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [&](const SyncProfile& p) { return p.name == name; });
    if (it == profiles.end()) {
        return Result<void>::Err("No profile named '" + name + "'");
    }
    profiles.erase(it);
    if (doc.value.active == name) {
        doc.value.active = profiles.empty() ? "" : profiles.front().name;
    }
    return write(doc.value);
}

Result<SyncProfile> ProfileStore::active() const {
    auto doc = read();
    if (doc.is_err()) return Result<SyncProfile>::Err(doc.error);
    if (doc.value.active.empty()) {
        return Result<SyncProfile>::Err("No active profile. Create one with 'new'.");
    }
    for (const auto& p : doc.value.profiles) {
        if (p.name == doc.value.active) return Result<SyncProfile>::Ok(p);
    }
    return Result<SyncProfile>::Err("Active profile '" + doc.value.active + "' not found");
}

std::string ProfileStore::active_name() const {
    auto doc = read();
    return doc.is_ok() ? doc.value.active : "";
}

Result<void> ProfileStore::set_active(const std::string& name) {
    auto doc = read();
    if (doc.is_err()) return Result<void>::Err(doc.error);

    bool found = false;
    for (const auto& p : doc.value.profiles) {
        if (p.name == name) found = true;
    }
    if (!found) {
        return Result<void>::Err("No profile named '" + name + "'");
    }
    doc.value.active = name;
    return write(doc.value);
}
