#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        test_dir = fs::temp_directory_path() / ("hpcsync_config_test_" + test_name);
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path p = test_dir / name;
        std::ofstream(p) << content;
        return p;
    }

    static SyncProfile make_profile(const std::string& name) {
        SyncProfile p;
        p.name = name;
        p.target.host = name + ".hpc.example.edu";
        p.local_dir = "/work/" + name;
        p.remote_dir = "/home/alice/" + name;
        p.exclude_patterns = default_exclude_patterns();
        return p;
    }
};

// ── Global config ───────────────────────────────────────

TEST_F(ConfigTest, DefaultConfigFileLoadsAsDefaults) {
    fs::path path = test_dir / "nested" / "config.yaml";
    ASSERT_TRUE(create_default_global_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto loaded = GlobalConfig::load_from(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.command_timeout, 15);
    EXPECT_EQ(loaded.value.transfer_timeout, 60);
    EXPECT_EQ(loaded.value.probe_timeout, 5);
    EXPECT_EQ(loaded.value.remote_tree_depth, 3);
    EXPECT_TRUE(loaded.value.confirm_delete);
}

TEST_F(ConfigTest, CustomValues) {
    auto path = write_file("config.yaml",
        "command_timeout: 30\ntransfer_timeout: 120\nremote_tree_depth: 5\n");
    auto loaded = GlobalConfig::load_from(path);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value.command_timeout, 30);
    EXPECT_EQ(loaded.value.transfer_timeout, 120);
    EXPECT_EQ(loaded.value.probe_timeout, 5);
    EXPECT_EQ(loaded.value.remote_tree_depth, 5);
}

TEST_F(ConfigTest, NonPositiveTimeoutsFallBack) {
    auto path = write_file("config.yaml", "command_timeout: 0\ntransfer_timeout: -4\n");
    auto loaded = GlobalConfig::load_from(path);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value.command_timeout, 15);
    EXPECT_EQ(loaded.value.transfer_timeout, 60);
}

TEST_F(ConfigTest, MalformedConfigIsError) {
    auto path = write_file("config.yaml", "command_timeout: [1, 2\n");
    auto loaded = GlobalConfig::load_from(path);
    EXPECT_TRUE(loaded.is_err());
    EXPECT_NE(loaded.error.find("Failed to parse global config"), std::string::npos);
}

// ── Profile parsing ─────────────────────────────────────

TEST_F(ConfigTest, MinimalProfileGetsDefaults) {
    auto parsed = parse_profile(YAML::Load(
        "{name: proj, host: hpc, remote_dir: /home/a/proj, local_dir: /work/proj}"));
    ASSERT_TRUE(parsed.is_ok()) << parsed.error;
    const auto& p = parsed.value;
    EXPECT_EQ(p.sync_mode, SyncMode::PUSH);
    EXPECT_EQ(p.exclude_patterns, default_exclude_patterns());
    EXPECT_FALSE(p.delete_on_sync);
    EXPECT_FALSE(p.remote_files_editable);
    EXPECT_EQ(p.remote_tree_depth, 3);
    EXPECT_FALSE(p.target.port.has_value());
    EXPECT_EQ(p.target.destination(), "hpc");
}

TEST_F(ConfigTest, DefaultExcludes) {
    std::vector<std::string> expected = {".git", "node_modules", "__pycache__", ".venv"};
    EXPECT_EQ(default_exclude_patterns(), expected);
}

TEST_F(ConfigTest, ProfileValidation) {
    EXPECT_TRUE(parse_profile(YAML::Load("{name: p, remote_dir: /x}")).is_err());
    EXPECT_TRUE(parse_profile(YAML::Load("{host: h, remote_dir: /x}")).is_err());
    EXPECT_TRUE(parse_profile(YAML::Load("{name: p, host: h, port: 0}")).is_err());
    EXPECT_TRUE(parse_profile(YAML::Load("{name: p, host: h, port: 70000}")).is_err());
    EXPECT_TRUE(parse_profile(YAML::Load("{name: p, host: h, remote_dir: /}")).is_err());
    EXPECT_TRUE(parse_profile(YAML::Load("{name: p, host: h, sync_mode: mirror}")).is_err());
    EXPECT_TRUE(parse_profile(YAML::Load("[1, 2]")).is_err());
}

TEST_F(ConfigTest, HostAndUserCannotBeSshOptions) {
    ConnectionTarget t;
    t.host = "-oProxyCommand=touch /tmp/x";
    auto bad_host = validate_target(t);
    ASSERT_TRUE(bad_host.is_err());
    EXPECT_NE(bad_host.error.find("invalid host"), std::string::npos);

    t.host = "hpc example";
    EXPECT_TRUE(validate_target(t).is_err());
    t.host = "hpc\tbox";
    EXPECT_TRUE(validate_target(t).is_err());
    t.host = "   ";
    EXPECT_TRUE(validate_target(t).is_err());

    t.host = "hpc.example.edu";
    t.user = "-lroot";
    EXPECT_TRUE(validate_target(t).is_err());
    t.user = "al ice";
    EXPECT_TRUE(validate_target(t).is_err());

    t.user = "alice";
    EXPECT_TRUE(validate_target(t).is_ok());
    t.user = "";
    EXPECT_TRUE(validate_target(t).is_ok());
}

TEST_F(ConfigTest, StoreRejectsOptionLikeHost) {
    auto parsed = parse_profile(YAML::Load(
        "{name: p, host: '-oProxyCommand=touch /tmp/x', remote_dir: /x}"));
    ASSERT_TRUE(parsed.is_err());
    EXPECT_NE(parsed.error.find("Profile 'p': invalid host"), std::string::npos);

    ProfileStore store(test_dir / "profiles.yaml");
    SyncProfile evil = make_profile("evil");
    evil.target.user = "-oProxyCommand=id";
    EXPECT_TRUE(store.save_profile(evil).is_err());
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value.empty());
}

TEST_F(ConfigTest, PullAndBothParse) {
    auto pull = parse_profile(YAML::Load("{name: p, host: h, sync_mode: pull}"));
    ASSERT_TRUE(pull.is_ok());
    EXPECT_EQ(pull.value.sync_mode, SyncMode::PULL);
    EXPECT_EQ(parse_sync_mode("both"), SyncMode::BOTH);
    EXPECT_FALSE(parse_sync_mode("sideways"));
}

// ── ProfileStore ────────────────────────────────────────

TEST_F(ConfigTest, EmptyStore) {
    ProfileStore store(test_dir / "profiles.yaml");
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value.empty());
    EXPECT_EQ(store.active_name(), "");
    EXPECT_TRUE(store.active().is_err());
}

TEST_F(ConfigTest, FirstSavedProfileBecomesActive) {
    ProfileStore store(test_dir / "profiles.yaml");
    ASSERT_TRUE(store.save_profile(make_profile("alpha")).is_ok());
    ASSERT_TRUE(store.save_profile(make_profile("beta")).is_ok());

    EXPECT_EQ(store.active_name(), "alpha");
    auto active = store.active();
    ASSERT_TRUE(active.is_ok());
    EXPECT_EQ(active.value.target.host, "alpha.hpc.example.edu");
    EXPECT_EQ(store.load().value.size(), 2u);
}

TEST_F(ConfigTest, SaveReplacesSameName) {
    ProfileStore store(test_dir / "profiles.yaml");
    auto p = make_profile("alpha");
    store.save_profile(p);
    p.remote_dir = "/scratch/alpha";
    store.save_profile(p);

    auto all = store.load().value;
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].remote_dir, "/scratch/alpha");
}

TEST_F(ConfigTest, AllFieldsSurviveSave) {
    ProfileStore store(test_dir / "profiles.yaml");
    SyncProfile p = make_profile("full");
    p.target.user = "alice";
    p.target.port = 2222;
    p.target.identity_file = "~/.ssh/id_hpc";
    p.exclude_patterns = {"*.log", "build/"};
    p.delete_on_sync = true;
    p.remote_tree_root = "/home/alice";
    p.remote_tree_depth = 5;
    p.remote_files_editable = true;
    ASSERT_TRUE(store.save_profile(p).is_ok());

    ProfileStore reopened(test_dir / "profiles.yaml");
    auto got = reopened.get("full");
    ASSERT_TRUE(got.is_ok()) << got.error;
    const auto& g = got.value;
    EXPECT_EQ(g.target.user, "alice");
    ASSERT_TRUE(g.target.port.has_value());
    EXPECT_EQ(*g.target.port, 2222);
    EXPECT_EQ(g.target.identity_file, "~/.ssh/id_hpc");
    EXPECT_EQ(g.exclude_patterns, p.exclude_patterns);
    EXPECT_TRUE(g.delete_on_sync);
    EXPECT_EQ(g.remote_tree_root, "/home/alice");
    EXPECT_EQ(g.remote_tree_depth, 5);
    EXPECT_TRUE(g.remote_files_editable);
    EXPECT_EQ(g.target.key(), "alice@full.hpc.example.edu:2222");
}

TEST_F(ConfigTest, InvalidProfileIsNotSaved) {
    ProfileStore store(test_dir / "profiles.yaml");
    auto p = make_profile("bad");
    p.remote_dir = "/";
    EXPECT_TRUE(store.save_profile(p).is_err());
    EXPECT_FALSE(fs::exists(store.path()));
}

TEST_F(ConfigTest, RemovingActiveReassigns) {
    ProfileStore store(test_dir / "profiles.yaml");
    store.save_profile(make_profile("alpha"));
    store.save_profile(make_profile("beta"));

    ASSERT_TRUE(store.remove_profile("alpha").is_ok());
    EXPECT_EQ(store.active_name(), "beta");

    ASSERT_TRUE(store.remove_profile("beta").is_ok());
    EXPECT_EQ(store.active_name(), "");
    EXPECT_TRUE(store.remove_profile("beta").is_err());
}

TEST_F(ConfigTest, SetActive) {
    ProfileStore store(test_dir / "profiles.yaml");
    store.save_profile(make_profile("alpha"));
    store.save_profile(make_profile("beta"));

    ASSERT_TRUE(store.set_active("beta").is_ok());
    EXPECT_EQ(store.active_name(), "beta");
    EXPECT_TRUE(store.set_active("gamma").is_err());
    EXPECT_EQ(store.active_name(), "beta");
}

TEST_F(ConfigTest, CorruptStoreIsError) {
    auto path = write_file("profiles.yaml",
        "active: x\nprofiles:\n  - {name: x, host: h, port: nope}\n");
    ProfileStore store(path);
    EXPECT_TRUE(store.load().is_err());
    EXPECT_TRUE(store.get("x").is_err());
}
