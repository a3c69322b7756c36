#include <gtest/gtest.h>
#include <core/requests.hpp>
#include <yaml-cpp/yaml.h>

TEST(Requests, SaveProfile) {
    auto r = parse_editor_request(
        R"({"type": "save-profile", "profile": {"name": "proj", "host": "hpc", "port": 2222,)"
        R"( "local_dir": "/work/proj", "remote_dir": "/home/a/proj", "delete_on_sync": true}})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(std::holds_alternative<SaveProfileRequest>(r.value));

    const auto& p = std::get<SaveProfileRequest>(r.value).profile;
    EXPECT_EQ(p.name, "proj");
    EXPECT_EQ(*p.target.port, 2222);
    EXPECT_TRUE(p.delete_on_sync);
}

TEST(Requests, SaveProfileIsValidated) {
    auto r = parse_editor_request(
        "{type: save-profile, profile: {name: proj, host: hpc, remote_dir: /}}");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("remote dir cannot be /"), std::string::npos);

    auto bad_port = parse_editor_request(
        "{type: save-profile, profile: {name: proj, host: hpc, port: 99999}}");
    EXPECT_TRUE(bad_port.is_err());
}

TEST(Requests, DeleteProfile) {
    auto r = parse_editor_request("{type: delete-profile, name: proj}");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(std::get<DeleteProfileRequest>(r.value).name, "proj");

    EXPECT_TRUE(parse_editor_request("{type: delete-profile}").is_err());
}

TEST(Requests, BrowseRemote) {
    auto r = parse_editor_request(
        "{type: browse-remote, host: hpc, user: alice, port: 22, start: /scratch}");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& b = std::get<BrowseRemoteRequest>(r.value);
    EXPECT_EQ(b.target.destination(), "alice@hpc");
    EXPECT_EQ(*b.target.port, 22);
    EXPECT_EQ(b.start, "/scratch");
}

TEST(Requests, BrowseWithoutHost) {
    auto r = parse_editor_request("{type: browse-remote, host: ''}");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Please fill in SSH Host before browsing remote directories.");
}

TEST(Requests, BrowseRejectsOptionLikeTarget) {
    auto host = parse_editor_request(
        R"({"type": "browse-remote", "host": "-oProxyCommand=touch /tmp/x"})");
    ASSERT_TRUE(host.is_err());
    EXPECT_NE(host.error.find("invalid host"), std::string::npos);

    auto user = parse_editor_request(
        R"({"type": "browse-remote", "host": "hpc", "user": "-lroot"})");
    ASSERT_TRUE(user.is_err());
    EXPECT_NE(user.error.find("invalid user"), std::string::npos);

    auto blank = parse_editor_request(R"({"type": "browse-remote", "host": "   "})");
    ASSERT_TRUE(blank.is_err());
    EXPECT_EQ(blank.error, "Please fill in SSH Host before browsing remote directories.");
}

TEST(Requests, SaveRejectsOptionLikeHost) {
    auto r = parse_editor_request(
        R"({"type": "save-profile", "profile": {"name": "p", "host": "-oProxyCommand=id"}})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("invalid host"), std::string::npos);
}

TEST(Requests, CancelAndError) {
    auto c = parse_editor_request("{type: cancel}");
    ASSERT_TRUE(c.is_ok());
    EXPECT_TRUE(std::holds_alternative<CancelRequest>(c.value));

    auto e = parse_editor_request("{type: error, message: boom}");
    ASSERT_TRUE(e.is_ok());
    EXPECT_EQ(std::get<ErrorReport>(e.value).message, "boom");
}

TEST(Requests, RejectsUnknownAndMalformed) {
    auto unknown = parse_editor_request("{type: launch-rockets}");
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.error, "Unknown request type: launch-rockets");

    EXPECT_TRUE(parse_editor_request("{type: ").is_err());
    EXPECT_TRUE(parse_editor_request("just text").is_err());
    EXPECT_TRUE(parse_editor_request("{name: x}").is_err());
}

// ── Responses ───────────────────────────────────────────

TEST(Responses, AreSingleLineMappings) {
    for (const auto& line : {ok_response(), error_response("bad: thing\n\"quoted\""),
                             set_remote_folder_response("/home/a/My Dir")}) {
        EXPECT_EQ(line.find('\n'), std::string::npos) << line;
    }
}

TEST(Responses, ParseBack) {
    YAML::Node ok = YAML::Load(ok_response());
    EXPECT_EQ(ok["type"].as<std::string>(), "ok");

    YAML::Node err = YAML::Load(error_response("bad: thing"));
    EXPECT_EQ(err["type"].as<std::string>(), "error");
    EXPECT_EQ(err["message"].as<std::string>(), "bad: thing");

    YAML::Node folder = YAML::Load(set_remote_folder_response("/home/a/My Dir"));
    EXPECT_EQ(folder["type"].as<std::string>(), "set-remote-folder");
    EXPECT_EQ(folder["path"].as<std::string>(), "/home/a/My Dir");
}
