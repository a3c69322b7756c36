#include <gtest/gtest.h>
#include "fakes.hpp"
#include <managers/tool_resolver.hpp>

static FakeProcessRunner::Matcher program_is(const std::string& program) {
    return [program](const platform::ProcessSpec& s) { return s.program == program; };
}

TEST(ToolResolver, FindsRsyncOnPath) {
    FakeProcessRunner runner;
    runner.on("rsync --version", ok_result("rsync  version 3.2.7"));

    ToolResolver tools(runner, true);
    auto info = tools.resolve("rsync");
    EXPECT_TRUE(info.available);
    EXPECT_EQ(info.path, "rsync");
    EXPECT_FALSE(info.via_compat);
}

TEST(ToolResolver, ResultIsMemoized) {
    FakeProcessRunner runner;
    runner.on("rsync --version", ok_result());

    ToolResolver tools(runner, true);
    tools.resolve("rsync");
    tools.resolve("rsync");
    EXPECT_EQ(runner.calls().size(), 1u);

    tools.clear_cache();
    tools.resolve("rsync");
    EXPECT_EQ(runner.calls().size(), 2u);
}

TEST(ToolResolver, MissingRsyncOnPosixStopsAfterPath) {
    FakeProcessRunner runner;

    ToolResolver tools(runner, true);
    EXPECT_FALSE(tools.resolve("rsync").available);
    EXPECT_EQ(runner.calls().size(), 1u);

    // Absence is memoized too.
    EXPECT_FALSE(tools.resolve("rsync").available);
    EXPECT_EQ(runner.calls().size(), 1u);
}

TEST(ToolResolver, BundledRsyncOnCompatHost) {
    FakeProcessRunner runner;
    runner.on_match(program_is(BUNDLED_RSYNC_PATH), ok_result());

    ToolResolver tools(runner, false);
    auto info = tools.resolve("rsync");
    EXPECT_TRUE(info.available);
    EXPECT_EQ(info.path, BUNDLED_RSYNC_PATH);
    EXPECT_FALSE(info.via_compat);
}

TEST(ToolResolver, RsyncThroughCompatibilityLayer) {
    FakeProcessRunner runner;
    runner.on("wsl rsync --version", ok_result());

    ToolResolver tools(runner, false);
    auto info = tools.resolve("rsync");
    EXPECT_TRUE(info.available);
    EXPECT_EQ(info.path, "rsync");
    EXPECT_TRUE(info.via_compat);
    EXPECT_EQ(runner.calls().size(), 3u);
}

TEST(ToolResolver, NothingOnCompatHost) {
    FakeProcessRunner runner;
    ToolResolver tools(runner, false);
    EXPECT_FALSE(tools.resolve("rsync").available);
}

TEST(ToolResolver, ScpCountsWhenItRunsAtAll) {
    FakeProcessRunner runner;
    runner.on_match(program_is("scp"), fail_result(1, "usage: scp [-346ABCOpqRrsTv] source ... target"));

    ToolResolver tools(runner, true);
    EXPECT_TRUE(tools.resolve("scp").available);
}

TEST(ToolResolver, ScpMissing) {
    FakeProcessRunner runner;
    ToolResolver tools(runner, true);
    EXPECT_FALSE(tools.resolve("scp").available);
}

TEST(ToolResolver, SshVersionProbe) {
    FakeProcessRunner runner;
    runner.on("ssh -V", ok_result());

    ToolResolver tools(runner, true);
    EXPECT_TRUE(tools.resolve("ssh").available);
}

TEST(ToolResolver, UnknownToolIsUnavailable) {
    FakeProcessRunner runner;
    ToolResolver tools(runner, true);
    EXPECT_FALSE(tools.resolve("unison").available);
    EXPECT_TRUE(runner.calls().empty());
}

TEST(ToolResolver, UsesProbeTimeout) {
    FakeProcessRunner runner;
    runner.on("rsync --version", ok_result());

    ToolResolver tools(runner, true, 1234);
    tools.resolve("rsync");
    ASSERT_EQ(runner.timeouts().size(), 1u);
    EXPECT_EQ(runner.timeouts()[0], 1234);
}
