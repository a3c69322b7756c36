#include "../hpcsync_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <managers/key_setup.hpp>
#include <managers/remote_browser.hpp>
#include <managers/remote_shell.hpp>

static void do_browse(BaseCLI& cli, const std::string& arg) {
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) return;
    if (!cli.ensure_connected(*profile)) {
        throw AuthError("Could not connect to " + profile->target.destination());
    }

    RemoteBrowser browser(*cli.explorer.session(), cli.prompter);
    auto chosen = browser.browse(profile->remote_dir);
    if (!chosen) {
        std::cout << theme::dim("    Nothing selected.") << "\n";
        return;
    }

    std::cout << theme::kv("Selected", *chosen);
    if (*chosen == profile->remote_dir) return;

    if (cli.prompter.confirm(fmt::format("Use {} as the remote dir for '{}'?",
                                         *chosen, profile->name))) {
        profile->remote_dir = *chosen;
        auto saved = cli.profiles.save_profile(*profile);
        if (saved.is_err()) {
            std::cout << theme::fail(saved.error);
            return;
        }
        cli.explorer.disconnect();
        std::cout << theme::ok("Remote dir updated.");
    }
}

static void do_shell(BaseCLI& cli, const std::string& arg) {
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) return;

    std::cout << theme::step(fmt::format("Opening shell on {} in {}",
                                         profile->target.destination(),
                                         profile->remote_dir.empty() ? "~" : profile->remote_dir));
    int code = open_remote_shell(*profile);
    if (code < 0) {
        throw ToolUnavailableError("Could not start ssh");
    }
    if (code != 0 && code != 130) {
        std::cout << theme::info(fmt::format("ssh exited with code {}", code));
    }
}

static void do_keysetup(BaseCLI& cli, const std::string& arg) {
    auto profile = cli.resolve_profile(trimmed(arg));
    if (!profile) return;

    std::cout << theme::section("SSH key setup");
    KeySetup setup(cli.runner, cli.prompter, KeySetup::default_key_path(),
                   cli.config.command_timeout * 1000);

    switch (setup.run(profile->target)) {
        case KeySetupResult::INSTALLED:
            std::cout << theme::ok(fmt::format(
                "SSH key installed on {}. Passwordless login is ready.",
                profile->target.destination()));
            break;
        case KeySetupResult::UNVERIFIED:
            throw ProcessError("Key setup finished but could not verify installation", 0, "");
        case KeySetupResult::CANCELLED:
            std::cout << theme::dim("    Cancelled.") << "\n";
            break;
    }
}

static void do_tools(BaseCLI& cli, const std::string& arg) {
    if (trimmed(arg) == "refresh") {
        cli.tools.clear_cache();
    }

    std::cout << theme::section("Tools");
    for (const char* name : {RSYNC_EXE, SSH_EXE, SCP_EXE}) {
        ToolInfo info = cli.tools.resolve(name);
        std::string value;
        if (!info.available) {
            value = theme::red("not found");
        } else if (info.via_compat) {
            value = theme::green(fmt::format("{} {}", COMPAT_LAYER_EXE, info.path));
        } else {
            value = theme::green(info.path);
        }
        std::cout << theme::kv(name, value);
    }
    std::cout << "\n";
}

void register_tool_commands(BaseCLI& cli) {
    cli.add_command("browse", do_browse, "Pick a remote directory interactively [profile]");
    cli.add_command("shell", do_shell, "Open a login shell in the remote dir [profile]");
    cli.add_command("keysetup", do_keysetup, "Install an SSH key on the remote host [profile]");
    cli.add_command("tools", do_tools, "Show which transfer tools were found [refresh]");
}
