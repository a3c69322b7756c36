#include <gtest/gtest.h>
#include <ssh/ssh_args.hpp>
#include <platform/process.hpp>
#include <algorithm>

// Runs `printf '%s' <quoted>` through the real /bin/sh and returns what it printed.
static std::string echo_through_shell(const std::string& value) {
    platform::PosixProcessRunner runner;
    platform::ProcessSpec spec;
    spec.program = "/bin/sh";
    spec.args = {"-c", "printf '%s' " + shell_quote(value)};
    auto r = runner.run(spec, 5000);
    EXPECT_TRUE(r.success()) << r.stderr_data;
    return r.stdout_data;
}

TEST(ShellQuote, WrapsInSingleQuotes) {
    EXPECT_EQ(shell_quote("abc"), "'abc'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(ShellQuote, EscapesEmbeddedSingleQuote) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(ShellQuote, SurvivesRealShell) {
    const std::vector<std::string> samples = {
        "plain",
        "with space",
        "it's",
        "''",
        "$HOME",
        "`id`",
        "$(whoami)",
        "a\"b",
        "back\\slash",
        "*.txt",
        "semi;colon && rm -rf nothing",
        "tab\there",
        "new\nline",
        "/home/user/My Project (copy)",
    };
    for (const auto& s : samples) {
        EXPECT_EQ(echo_through_shell(s), s) << "value: " << s;
    }
}

// ── ssh argv ────────────────────────────────────────────

static bool contains_pair(const std::vector<std::string>& args,
                          const std::string& a, const std::string& b) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == a && args[i + 1] == b) return true;
    }
    return false;
}

TEST(SshArgs, BatchModeWithoutCredential) {
    ConnectionTarget t;
    t.host = "hpc.example.edu";
    t.user = "alice";

    auto args = build_ssh_args(t, "echo ok", false);
    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ(args[args.size() - 2], "alice@hpc.example.edu");
    EXPECT_EQ(args.back(), "echo ok");
    EXPECT_TRUE(contains_pair(args, "-o", "BatchMode=yes"));
    EXPECT_FALSE(contains_pair(args, "-o", "NumberOfPasswordPrompts=1"));
    EXPECT_TRUE(contains_pair(args, "-o", "StrictHostKeyChecking=accept-new"));
}

TEST(SshArgs, SinglePromptWithCredential) {
    ConnectionTarget t;
    t.host = "hpc";
    auto args = build_ssh_args(t, "ls", true);
    EXPECT_TRUE(contains_pair(args, "-o", "NumberOfPasswordPrompts=1"));
    EXPECT_FALSE(contains_pair(args, "-o", "BatchMode=yes"));
}

TEST(SshArgs, PortAndIdentity) {
    ConnectionTarget t;
    t.host = "hpc";
    t.port = 2222;
    t.identity_file = "/home/a/.ssh/id_x";

    auto args = build_ssh_args(t, "ls", false);
    EXPECT_TRUE(contains_pair(args, "-p", "2222"));
    EXPECT_TRUE(contains_pair(args, "-i", "/home/a/.ssh/id_x"));

    auto scp = build_scp_options(t, false);
    EXPECT_EQ(scp.front(), "-r");
    EXPECT_TRUE(contains_pair(scp, "-P", "2222"));
    EXPECT_TRUE(contains_pair(scp, "-o", "BatchMode=yes"));
}

TEST(SshArgs, NoPortFlagWhenUnset) {
    ConnectionTarget t;
    t.host = "hpc";
    auto args = build_ssh_args(t, "ls", false);
    EXPECT_EQ(std::find(args.begin(), args.end(), "-p"), args.end());
}

TEST(SshArgs, RsyncCommandQuotesIdentity) {
    ConnectionTarget t;
    t.host = "hpc";
    t.port = 22;
    t.identity_file = "/keys/my key";

    EXPECT_EQ(rsync_ssh_command(t, false),
              "ssh -p 22 -i '/keys/my key' -o StrictHostKeyChecking=accept-new -o BatchMode=yes");
    EXPECT_EQ(rsync_ssh_command(t, true),
              "ssh -p 22 -i '/keys/my key' -o StrictHostKeyChecking=accept-new "
              "-o NumberOfPasswordPrompts=1");
}

TEST(SshArgs, ShellStartsInRemoteDir) {
    ConnectionTarget t;
    t.host = "hpc";
    t.user = "bob";

    auto args = build_shell_args(t, "/scratch/bob/my proj");
    ASSERT_GE(args.size(), 3u);
    EXPECT_TRUE(contains_pair(args, "-o", "ForwardAgent=no"));
    EXPECT_EQ(args[args.size() - 3], "bob@hpc");
    EXPECT_EQ(args[args.size() - 2], "-t");
    EXPECT_EQ(args.back(), "cd '/scratch/bob/my proj' && exec $SHELL -l");
}
