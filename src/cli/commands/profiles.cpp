#include "../hpcsync_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/utils.hpp>

static void do_profiles(BaseCLI& cli, const std::string& arg) {
    auto loaded = cli.profiles.load();
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return;
    }

    std::cout << theme::section("Profiles");
    if (loaded.value.empty()) {
        std::cout << theme::dim("    No profiles. Run 'new <name>' to create one.") << "\n\n";
        return;
    }

    std::string active = cli.profiles.active_name();
    for (const auto& p : loaded.value) {
        std::string marker = p.name == active ? theme::green("*") : " ";
        std::cout << "  " << marker << " "
                  << theme::blue(fmt::format("{:<16}", p.name))
                  << theme::dim(fmt::format("{} -> {}:{}", p.local_dir,
                                            p.target.destination(), p.remote_dir))
                  << "\n";
    }
    std::cout << "\n";
}

static void do_use(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) {
        std::cout << theme::fail("Usage: use <profile>");
        return;
    }

    auto result = cli.profiles.set_active(name);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }

    // A different profile means a different host.
    if (cli.explorer.connected() && cli.explorer.profile() &&
        cli.explorer.profile()->name != name) {
        cli.explorer.disconnect();
    }
    std::cout << theme::ok("Active profile: " + name);
}

static void do_new(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) {
        std::cout << theme::fail("Usage: new <profile>");
        return;
    }

    std::optional<SyncProfile> existing;
    auto found = cli.profiles.get(name);
    if (found.is_ok()) {
        if (!cli.prompter.confirm(fmt::format("Profile '{}' exists. Edit it?", name))) {
            return;
        }
        existing = found.value;
    }

    auto profile = run_profile_wizard(cli, name, existing ? &*existing : nullptr);
    if (!profile) {
        std::cout << theme::dim("    Cancelled.") << "\n";
        return;
    }

    auto saved = cli.profiles.save_profile(*profile);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return;
    }

    // Drop a session opened with the old settings.
    if (cli.explorer.profile() && cli.explorer.profile()->name == name) {
        cli.explorer.disconnect();
    }
    std::cout << theme::ok(fmt::format("Saved profile '{}' to {}", name,
                                       cli.profiles.path().string()));
}

static void do_delete(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) {
        std::cout << theme::fail("Usage: delete <profile>");
        return;
    }

    if (!cli.prompter.confirm(fmt::format("Delete profile '{}'?", name))) {
        return;
    }

    auto result = cli.profiles.remove_profile(name);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }

    if (cli.explorer.profile() && cli.explorer.profile()->name == name) {
        cli.explorer.disconnect();
    }
    std::cout << theme::ok("Deleted profile " + name);
    std::string active = cli.profiles.active_name();
    if (!active.empty()) {
        std::cout << theme::kv("Active", active);
    }
}

void register_profile_commands(BaseCLI& cli) {
    cli.add_command("profiles", do_profiles, "List sync profiles");
    cli.add_command("use", do_use, "Make a profile active");
    cli.add_command("new", do_new, "Create or edit a profile");
    cli.add_command("delete", do_delete, "Delete a profile");
}
