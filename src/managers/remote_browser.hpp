#pragma once

#include <string>
#include <optional>

class RemoteSession;
class Prompter;

// Interactive picker for a remote directory, one level per prompt.
class RemoteBrowser {
public:
    RemoteBrowser(RemoteSession& session, Prompter& prompter);

    // Starts at `start`, or the remote $HOME (falling back to "/").
    // Returns the chosen directory, or nullopt if the user backed out or
    // the remote side could not be listed.
    std::optional<std::string> browse(const std::string& start = "");

private:
    RemoteSession& session_;
    Prompter& prompter_;

    std::string initial_path(const std::string& start);
};
