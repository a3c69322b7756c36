#include "../hpcsync_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>

static void do_connect(BaseCLI& cli, const std::string& arg) {
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) {
        return;
    }
    if (cli.explorer.connected()) {
        cli.explorer.disconnect();
    }
    if (!cli.ensure_connected(*profile)) {
        throw AuthError("Could not connect to " + profile->target.destination());
    }
    std::cout << theme::kv("Auth", cli.explorer.session()->uses_password() ? "password" : "key");
    std::cout << theme::kv("Root", cli.explorer.root());
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    if (!cli.explorer.connected()) {
        std::cout << theme::fail("Not connected.");
        return;
    }

    std::string dest = cli.explorer.profile()->target.destination();
    cli.explorer.disconnect();
    std::cout << theme::ok("Disconnected from " + dest);
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    std::cout << theme::kv("Config", get_global_config_path().string());
    std::cout << theme::kv("Profiles", cli.profiles.path().string());

    std::string active = cli.profiles.active_name();
    if (!active.empty()) {
        std::cout << theme::kv("Profile", active);
        auto profile = cli.profiles.get(active);
        if (profile.is_ok()) {
            std::cout << theme::kv("Local", profile.value.local_dir);
            std::cout << theme::kv("Remote", profile.value.target.destination() + ":" +
                                             profile.value.remote_dir);
        }
    } else {
        std::cout << theme::fail("No active profile");
    }

    if (cli.explorer.connected()) {
        std::cout << theme::kv("SSH", "connected to " + cli.explorer.profile()->target.destination());
    } else {
        std::cout << theme::kv("SSH", "not connected");
    }

    SyncState state = cli.sync.state();
    std::cout << theme::kv("Sync", cli.sync.active() ? "syncing" : to_string(state));
    std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Connect to the active (or named) profile's host");
    cli.add_command("disconnect", do_disconnect, "Drop the connection and its credential");
    cli.add_command("status", do_status, "Show profile, connection and sync status");
}
