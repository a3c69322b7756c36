#include "requests.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <vector>

static const char* BROWSE_NEEDS_HOST =
    "Please fill in SSH Host before browsing remote directories.";

static Result<EditorRequest> parse_browse(const YAML::Node& root) {
    BrowseRemoteRequest req;
    req.target.host = root["host"].as<std::string>("");
    if (trimmed(req.target.host).empty()) {
        return Result<EditorRequest>::Err(BROWSE_NEEDS_HOST);
    }
    req.target.user = root["user"].as<std::string>("");
    req.target.identity_file = root["identity_file"].as<std::string>("");
    if (root["port"] && !root["port"].IsNull()) {
        int port = root["port"].as<int>(0);
        if (port < 1 || port > 65535) {
            return Result<EditorRequest>::Err("Port must be between 1 and 65535");
        }
        req.target.port = port;
    }
    auto valid = validate_target(req.target);
    if (valid.is_err()) {
        return Result<EditorRequest>::Err("Cannot browse: " + valid.error);
    }
    req.start = root["start"].as<std::string>("");
    return Result<EditorRequest>::Ok(req);
}

Result<EditorRequest> parse_editor_request(const std::string& line) {
    YAML::Node root;
    try {
        root = YAML::Load(line);
    } catch (const YAML::Exception& e) {
        return Result<EditorRequest>::Err(std::string("Malformed request: ") + e.what());
    }
    if (!root.IsMap()) {
        return Result<EditorRequest>::Err("Malformed request: expected a mapping");
    }

    std::string type = root["type"].as<std::string>("");

    if (type == "save-profile") {
        auto parsed = parse_profile(root["profile"]);
        if (parsed.is_err()) return Result<EditorRequest>::Err(parsed.error);
        return Result<EditorRequest>::Ok(SaveProfileRequest{parsed.value});
    }
    if (type == "delete-profile") {
        std::string name = root["name"].as<std::string>("");
        if (name.empty()) return Result<EditorRequest>::Err("Profile name is required");
        return Result<EditorRequest>::Ok(DeleteProfileRequest{name});
    }
    if (type == "browse-remote") {
        return parse_browse(root);
    }
    if (type == "cancel") {
        return Result<EditorRequest>::Ok(CancelRequest{});
    }
    if (type == "error") {
        return Result<EditorRequest>::Ok(
            ErrorReport{root["message"].as<std::string>("Unknown error")});
    }
    if (type.empty()) {
        return Result<EditorRequest>::Err("Malformed request: missing type");
    }
    return Result<EditorRequest>::Err("Unknown request type: " + type);
}

// ── Responses ───────────────────────────────────────────────

static std::string flow_map(const std::vector<std::pair<std::string, std::string>>& fields) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    for (const auto& [key, value] : fields) {
        out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << value;
    }
    out << YAML::EndMap;
    return out.c_str();
}

std::string ok_response() {
    return flow_map({{"type", "ok"}});
}

std::string error_response(const std::string& message) {
    return flow_map({{"type", "error"}, {"message", message}});
}

std::string set_remote_folder_response(const std::string& path) {
    return flow_map({{"type", "set-remote-folder"}, {"path", path}});
}
