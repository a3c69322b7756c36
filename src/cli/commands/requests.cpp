#include "../hpcsync_cli.hpp"
#include <iostream>
#include <variant>
#include <fmt/format.h>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/requests.hpp>
#include <core/utils.hpp>
#include <managers/remote_browser.hpp>
#include <ssh/remote_session.hpp>

namespace {

// Turns one validated request into one response line.
struct RequestHandler {
    BaseCLI& cli;

    std::string operator()(const SaveProfileRequest& req) const {
        auto saved = cli.profiles.save_profile(req.profile);
        if (saved.is_err()) return error_response(saved.error);
        return ok_response();
    }

    std::string operator()(const DeleteProfileRequest& req) const {
        auto removed = cli.profiles.remove_profile(req.name);
        if (removed.is_err()) return error_response(removed.error);
        return ok_response();
    }

    std::string operator()(const BrowseRemoteRequest& req) const {
        RemoteSession session(req.target, cli.channel, cli.prompter, cli.timeouts());
        RemoteBrowser browser(session, cli.prompter);
        auto chosen = browser.browse(req.start);
        session.dispose();
        if (!chosen) return ok_response();
        return set_remote_folder_response(*chosen);
    }

    std::string operator()(const CancelRequest&) const {
        cli.sync.cancel();
        return ok_response();
    }

    std::string operator()(const ErrorReport& req) const {
        cli.prompter.error(req.message);
        return ok_response();
    }
};

} // namespace

int run_request_loop(BaseCLI& cli, std::istream& in, std::ostream& out) {
    RequestHandler handler{cli};
    std::string line;
    while (std::getline(in, line)) {
        if (trimmed(line).empty()) continue;

        auto parsed = parse_editor_request(line);
        if (parsed.is_err()) {
            hpcsync_log("request: rejected: " + parsed.error);
            out << error_response(parsed.error) << "\n" << std::flush;
            continue;
        }

        std::string response;
        try {
            response = std::visit(handler, parsed.value);
        } catch (const std::exception& e) {
            hpcsync_log(fmt::format("request: failed: {}", e.what()));
            response = error_response(e.what());
        }
        out << response << "\n" << std::flush;
    }
    return 0;
}
