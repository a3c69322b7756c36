#include "../hpcsync_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/interrupt.hpp>

// Echo operation log lines to the terminal while a push runs.
struct LogEcho {
    OperationLog& log;
    int token;

    explicit LogEcho(OperationLog& l)
        : log(l), token(l.subscribe([](const std::string& line) {
              std::cout << theme::log(line) << std::flush;
          })) {}
    ~LogEcho() { log.unsubscribe(token); }
};

static void run_push(BaseCLI& cli, const std::string& profile_name, bool dry_run) {
    auto profile = cli.resolve_profile(profile_name);
    if (!profile) {
        throw ValidationError("No profile to push");
    }

    // Authenticate first so a password prompt happens here, once, and the
    // transfer can reuse the credential.
    if (!cli.ensure_connected(*profile)) {
        throw AuthError("Push aborted: not connected to " + profile->target.destination());
    }

    std::cout << theme::section(dry_run ? "Dry run" : "Push");
    std::cout << theme::kv("From", profile->local_dir);
    std::cout << theme::kv("To", profile->target.destination() + ":" + profile->remote_dir);
    std::cout << theme::dim("    Ctrl-C cancels the transfer.") << "\n";

    SyncOutcome outcome = SyncOutcome::COMPLETED;
    {
        LogEcho echo(cli.oplog);
        platform::InterruptWatcher watcher([&cli]() { cli.sync.cancel(); });
        try {
            outcome = cli.sync.push(*profile, dry_run, cli.explorer.session());
        } catch (const CancelledError&) {
            std::cout << theme::warn("Sync cancelled.");
            return;
        }
    }

    switch (outcome) {
        case SyncOutcome::COMPLETED:
            std::cout << theme::ok(dry_run ? "Dry run complete. Nothing was changed."
                                           : "Sync complete.");
            break;
        case SyncOutcome::DECLINED:
            std::cout << theme::info("Sync skipped. Remote files were left alone.");
            break;
        case SyncOutcome::DRY_RUN_UNSUPPORTED:
            std::cout << theme::info("Install rsync to preview a sync.");
            break;
    }
}

static void do_push(BaseCLI& cli, const std::string& arg) {
    bool dry_run = false;
    std::string name;
    for (const auto& word : split_args(arg)) {
        if (word == "--dry-run" || word == "-n") {
            dry_run = true;
        } else if (name.empty()) {
            name = word;
        } else {
            throw ValidationError("Usage: push [--dry-run] [profile]");
        }
    }
    run_push(cli, name, dry_run);
}

static void do_dryrun(BaseCLI& cli, const std::string& arg) {
    run_push(cli, trimmed(arg), true);
}

static void do_log(BaseCLI& cli, const std::string& arg) {
    if (trimmed(arg) == "clear") {
        cli.oplog.clear();
        std::cout << theme::ok("Operation log cleared.");
        return;
    }

    auto lines = cli.oplog.lines();
    size_t count = lines.size();
    int n = safe_stoi(trimmed(arg), 0);
    if (n > 0 && static_cast<size_t>(n) < count) count = static_cast<size_t>(n);

    std::cout << theme::section("Operation log");
    if (lines.empty()) {
        std::cout << theme::dim("    Empty.") << "\n\n";
        return;
    }
    for (size_t i = lines.size() - count; i < lines.size(); ++i) {
        std::cout << theme::log(lines[i]);
    }
    std::cout << "\n";
}

void register_sync_commands(BaseCLI& cli) {
    cli.add_command("push", do_push, "Push local files to the remote dir [--dry-run] [profile]");
    cli.add_command("dryrun", do_dryrun, "Show what push would transfer [profile]");
    cli.add_command("log", do_log, "Show the operation log [n | clear]");
}
