#pragma once

#include <string>
#include <variant>
#include "types.hpp"

// Messages an editor frontend sends over `hpcsync request`, one per line.

struct SaveProfileRequest {
    SyncProfile profile;
};

struct DeleteProfileRequest {
    std::string name;
};

struct BrowseRemoteRequest {
    ConnectionTarget target;
    std::string start;                      // empty = remote $HOME
};

struct CancelRequest {};

struct ErrorReport {
    std::string message;
};

using EditorRequest = std::variant<SaveProfileRequest, DeleteProfileRequest,
                                   BrowseRemoteRequest, CancelRequest, ErrorReport>;

// Parse and validate one line (a flow-style YAML or JSON mapping with a
// `type` key). Validation failures come back as Err with a user-facing message.
Result<EditorRequest> parse_editor_request(const std::string& line);

// Single-line responses
std::string ok_response();
std::string error_response(const std::string& message);
std::string set_remote_folder_response(const std::string& path);
