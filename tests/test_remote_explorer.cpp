#include <gtest/gtest.h>
#include "fakes.hpp"
#include <core/errors.hpp>
#include <managers/remote_explorer.hpp>
#include <ssh/command_channel.hpp>

static const char* ROOT_LISTING =
    "total 12\n"
    "-rw-r--r-- 1 a g  10 1700000000 zeta.txt\n"
    "drwxr-xr-x 2 a g 4096 1700000000 src\n"
    "-rw-r--r-- 1 a g  20 1700000000 alpha.txt\n"
    "drwxr-xr-x 2 a g 4096 1700000000 data\n";

static const char* SRC_LISTING =
    "drwxr-xr-x 2 a g 4096 1700000000 pkg\n"
    "-rw-r--r-- 1 a g   5 1700000000 main.py\n";

static const char* PKG_LISTING =
    "-rw-r--r-- 1 a g   5 1700000000 mod.py\n";

class RemoteExplorerTest : public ::testing::Test {
protected:
    FakeProcessRunner runner;
    FakePrompter prompter;
    CommandChannel channel{runner};
    RemoteExplorer explorer{channel, prompter};
    SyncProfile profile;

    void SetUp() override {
        runner.on("echo ok", ok_result("ok\n"));
        runner.on("'/proj' 2>", ok_result(ROOT_LISTING));
        runner.on("'/proj/src' 2>", ok_result(SRC_LISTING));
        runner.on("'/proj/data' 2>", ok_result(""));
        runner.on("'/proj/src/pkg' 2>", ok_result(PKG_LISTING));

        profile.name = "proj";
        profile.target.host = "hpc";
        profile.remote_dir = "/proj/";
        profile.remote_tree_depth = 3;
    }
};

TEST_F(RemoteExplorerTest, NoSessionIsUnavailable) {
    EXPECT_FALSE(explorer.connected());
    EXPECT_THROW(explorer.children(), UnavailableError);
    EXPECT_THROW(explorer.stat("/proj/a"), UnavailableError);
    EXPECT_THROW(explorer.create_directory("/proj/x"), UnavailableError);
}

TEST_F(RemoteExplorerTest, ConnectAuthenticates) {
    explorer.connect(profile);
    EXPECT_TRUE(explorer.connected());
    ASSERT_TRUE(explorer.profile());
    EXPECT_EQ(explorer.profile()->name, "proj");

    explorer.disconnect();
    EXPECT_FALSE(explorer.connected());
    EXPECT_EQ(explorer.session(), nullptr);
}

TEST_F(RemoteExplorerTest, FailedConnectLeavesNoSession) {
    FakeProcessRunner refusing;
    refusing.on("echo ok", fail_result(255, "Permission denied"));
    CommandChannel ch(refusing);
    RemoteExplorer ex(ch, prompter);

    EXPECT_THROW(ex.connect(profile), AuthError);
    EXPECT_FALSE(ex.connected());
    EXPECT_EQ(ex.session(), nullptr);
}

TEST_F(RemoteExplorerTest, RootDefaultsToRemoteDir) {
    explorer.connect(profile);
    EXPECT_EQ(explorer.root(), "/proj");

    profile.remote_tree_root = "/proj/src/";
    explorer.connect(profile);
    EXPECT_EQ(explorer.root(), "/proj/src");
}

TEST_F(RemoteExplorerTest, ChildrenDirectoriesFirstThenByName) {
    explorer.connect(profile);
    auto kids = explorer.children();
    ASSERT_EQ(kids.size(), 4u);
    EXPECT_EQ(kids[0].entry.name, "data");
    EXPECT_EQ(kids[1].entry.name, "src");
    EXPECT_EQ(kids[2].entry.name, "alpha.txt");
    EXPECT_EQ(kids[3].entry.name, "zeta.txt");
    EXPECT_EQ(kids[1].path, "/proj/src");
    EXPECT_EQ(kids[1].depth, 1);
}

TEST_F(RemoteExplorerTest, DepthLimitStopsListing) {
    profile.remote_tree_depth = 1;
    explorer.connect(profile);

    EXPECT_EQ(explorer.children().size(), 4u);
    EXPECT_TRUE(explorer.children("/proj/src").empty());
    EXPECT_EQ(runner.count("'/proj/src' 2>"), 0);
}

TEST_F(RemoteExplorerTest, OutsideTheTreeIsEmpty) {
    explorer.connect(profile);
    EXPECT_TRUE(explorer.children("/etc").empty());
}

TEST_F(RemoteExplorerTest, TreeWalksToDepth) {
    profile.remote_tree_depth = 2;
    explorer.connect(profile);

    auto all = explorer.tree();
    std::vector<std::string> paths;
    for (const auto& e : all) paths.push_back(e.path);

    std::vector<std::string> expected = {
        "/proj/data",
        "/proj/src",
        "/proj/src/pkg",
        "/proj/src/main.py",
        "/proj/alpha.txt",
        "/proj/zeta.txt",
    };
    EXPECT_EQ(paths, expected);
    EXPECT_EQ(runner.count("'/proj/src/pkg' 2>"), 0);
}

TEST_F(RemoteExplorerTest, StatAndReadFailuresAreNotFound) {
    runner.on("stat --format", fail_result(1, "stat: cannot stat"));
    runner.on("base64 -- '/proj/missing'", fail_result(1, "base64: No such file"));
    explorer.connect(profile);

    EXPECT_THROW(explorer.stat("/proj/missing"), NotFoundError);
    EXPECT_THROW(explorer.read("/proj/missing"), NotFoundError);
}

TEST_F(RemoteExplorerTest, WriteNeedsEditableProfile) {
    runner.on("base64 -d >", ok_result());
    explorer.connect(profile);

    EXPECT_THROW(explorer.write("/proj/a.txt", "x"), PermissionDeniedError);
    EXPECT_EQ(runner.count("base64 -d >"), 0);

    profile.remote_files_editable = true;
    explorer.connect(profile);
    explorer.write("/proj/a.txt", "x");
    EXPECT_EQ(runner.count("base64 -d >"), 1);
}

TEST_F(RemoteExplorerTest, StructuralChangesAreNotSupported) {
    explorer.connect(profile);
    EXPECT_THROW(explorer.create_directory("/proj/new"), NotSupportedError);
    EXPECT_THROW(explorer.remove("/proj/alpha.txt"), NotSupportedError);
    EXPECT_THROW(explorer.rename("/proj/alpha.txt", "/proj/beta.txt"), NotSupportedError);
}

TEST_F(RemoteExplorerTest, RefreshDropsCachedListings) {
    explorer.connect(profile);
    explorer.children();
    explorer.children();
    EXPECT_EQ(runner.count("'/proj' 2>"), 1);

    explorer.refresh();
    explorer.children();
    EXPECT_EQ(runner.count("'/proj' 2>"), 2);
}
