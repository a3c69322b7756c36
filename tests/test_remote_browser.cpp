#include <gtest/gtest.h>
#include "fakes.hpp"
#include <managers/remote_browser.hpp>
#include <ssh/command_channel.hpp>
#include <ssh/remote_session.hpp>

class RemoteBrowserTest : public ::testing::Test {
protected:
    FakeProcessRunner runner;
    FakePrompter prompter;
    CommandChannel channel{runner};
    std::unique_ptr<RemoteSession> session;

    void SetUp() override {
        runner.on("echo ok", ok_result("ok\n"));
        runner.on("echo $HOME", ok_result("/home/alice\n"));
        runner.on("ls -1 -p '/home/alice'", ok_result("proj/\nnotes.txt\ndata/\n"));
        runner.on("ls -1 -p '/home/alice/proj'", ok_result("src/\nmain.py\n"));
        runner.on("ls -1 -p '/home'", ok_result("alice/\nbob/\n"));
        runner.on("ls -1 -p '/'", ok_result("home/\ntmp/\n"));

        ConnectionTarget target;
        target.host = "hpc";
        session = std::make_unique<RemoteSession>(target, channel, prompter);
    }

    std::optional<std::string> browse(const std::string& start = "") {
        RemoteBrowser browser(*session, prompter);
        return browser.browse(start);
    }
};

TEST_F(RemoteBrowserTest, StartsAtRemoteHome) {
    prompter.choices.push_back(0);
    auto chosen = browse();
    ASSERT_TRUE(chosen);
    EXPECT_EQ(*chosen, "/home/alice");

    ASSERT_EQ(prompter.choice_options.size(), 1u);
    std::vector<std::string> expected = {
        "Select: /home/alice", "Create new directory here...", "..", "data", "proj"};
    EXPECT_EQ(prompter.choice_options[0], expected);
}

TEST_F(RemoteBrowserTest, DescendIntoDirectory) {
    prompter.choices = {4, 0};
    auto chosen = browse();
    ASSERT_TRUE(chosen);
    EXPECT_EQ(*chosen, "/home/alice/proj");
}

TEST_F(RemoteBrowserTest, GoUpOneLevel) {
    prompter.choices = {2, 0};
    auto chosen = browse("/home/alice");
    ASSERT_TRUE(chosen);
    EXPECT_EQ(*chosen, "/home");
    EXPECT_EQ(runner.count("echo $HOME"), 0);
}

TEST_F(RemoteBrowserTest, RootHasNoParentEntry) {
    prompter.choices.push_back(0);
    auto chosen = browse("/");
    ASSERT_TRUE(chosen);
    EXPECT_EQ(*chosen, "/");

    std::vector<std::string> expected = {
        "Select: /", "Create new directory here...", "home", "tmp"};
    EXPECT_EQ(prompter.choice_options[0], expected);
}

TEST_F(RemoteBrowserTest, CreateDirectory) {
    runner.on("mkdir -p", ok_result());
    prompter.choices.push_back(1);
    prompter.lines.push_back(std::string("results"));

    auto chosen = browse();
    ASSERT_TRUE(chosen);
    EXPECT_EQ(*chosen, "/home/alice/results");
    EXPECT_EQ(runner.count("mkdir -p '/home/alice/results'"), 1);
}

TEST_F(RemoteBrowserTest, RejectsNamesWithSlash) {
    prompter.choices = {1, 0};
    prompter.lines.push_back(std::string("a/b"));

    auto chosen = browse();
    ASSERT_TRUE(chosen);
    EXPECT_EQ(*chosen, "/home/alice");
    ASSERT_EQ(prompter.errors.size(), 1u);
    EXPECT_EQ(prompter.errors[0], "Name cannot contain /");
    EXPECT_EQ(runner.count("mkdir"), 0);
}

TEST_F(RemoteBrowserTest, RejectsEmptyName) {
    prompter.choices = {1, 0};
    prompter.lines.push_back(std::string("   "));

    auto chosen = browse();
    ASSERT_TRUE(chosen);
    ASSERT_EQ(prompter.errors.size(), 1u);
    EXPECT_EQ(prompter.errors[0], "Name cannot be empty");
}

TEST_F(RemoteBrowserTest, CancelReturnsNothing) {
    EXPECT_FALSE(browse());
}

TEST_F(RemoteBrowserTest, HomeLookupFailureStartsAtRoot) {
    FakeProcessRunner bare;
    bare.on("echo ok", ok_result("ok\n"));
    bare.on("ls -1 -p '/'", ok_result("home/\n"));
    CommandChannel ch(bare);
    ConnectionTarget target;
    target.host = "hpc";
    RemoteSession s(target, ch, prompter);

    prompter.choices.push_back(0);
    RemoteBrowser browser(s, prompter);
    auto chosen = browser.browse();
    ASSERT_TRUE(chosen);
    EXPECT_EQ(*chosen, "/");
}

TEST_F(RemoteBrowserTest, AuthFailureIsReported) {
    FakeProcessRunner refusing;
    refusing.on("echo ok", fail_result(255, "Permission denied (publickey)."));
    CommandChannel ch(refusing);
    ConnectionTarget target;
    target.host = "hpc";
    RemoteSession s(target, ch, prompter);

    RemoteBrowser browser(s, prompter);
    EXPECT_FALSE(browser.browse());
    ASSERT_EQ(prompter.errors.size(), 1u);
    EXPECT_EQ(prompter.errors[0], "Authentication cancelled");
    EXPECT_TRUE(prompter.choice_options.empty());
}

TEST_F(RemoteBrowserTest, ListingFailureIsReported) {
    runner.on("ls -1 -p '/nope'", fail_result(2, "ls: cannot access '/nope'"));
    EXPECT_FALSE(browse("/nope"));
    ASSERT_EQ(prompter.errors.size(), 1u);
    EXPECT_NE(prompter.errors[0].find("Failed to list remote directory"), std::string::npos);
}
