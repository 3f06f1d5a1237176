#include <gtest/gtest.h>
#include "common/app_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("vaultrelay_cfg_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
        path_ = (root_ / "config.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& text) { std::ofstream(path_) << text; }

    fs::path root_;
    std::string path_;
};

TEST_F(AppConfigTest, LoadsFullConfig) {
    write(R"({
        "base_dir": "/home/jane",
        "remote_path": "/run/user/1000/gvfs/google-drive:host=gmail.com,user=jane",
        "remote_backup_dir": "Backups",
        "network_quality": "poor",
        "auto_mount_remote": false,
        "log_level": "debug",
        "profiles": [
            {"id": "main", "name": "Main", "container": "vault.hc", "sources": ["Documents", "Pictures/"]},
            {"id": "work", "name": "Work", "container": "work.hc", "sources": []}
        ]
    })");

    std::string error;
    auto config = loadConfig(path_, error);
    ASSERT_TRUE(config.has_value()) << error;
    EXPECT_EQ(config->baseDir, "/home/jane");
    EXPECT_EQ(config->run.remoteBackupDir, "Backups");
    EXPECT_EQ(config->run.networkQuality, NetworkQuality::Poor);
    EXPECT_FALSE(config->run.autoMountRemote);
    EXPECT_EQ(config->logLevel, LogLevel::DEBUG);
    ASSERT_EQ(config->profiles.size(), 2u);

    auto first = config->findProfile("");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, "main");
    EXPECT_EQ(config->findProfile("work")->container, "work.hc");
    EXPECT_FALSE(config->findProfile("nope").has_value());

    ResolvedProfile resolved = resolveProfile(*first, config->baseDir);
    EXPECT_EQ(resolved.containerPath, "/home/jane/vault.hc");
    EXPECT_EQ(resolved.secretIdentity, "vault.hc");
    ASSERT_EQ(resolved.sourceDirs.size(), 2u);
    EXPECT_EQ(resolved.sourceDirs[1], "/home/jane/Pictures");
}

TEST_F(AppConfigTest, NumericNetworkQuality) {
    write(R"({"remote_path": "", "remote_backup_dir": "B", "network_quality": 2,
              "profiles": [{"id": "a", "name": "A", "container": "c.hc", "sources": []}]})");
    std::string error;
    auto config = loadConfig(path_, error);
    ASSERT_TRUE(config.has_value()) << error;
    EXPECT_EQ(config->run.networkQuality, NetworkQuality::Terrible);
    EXPECT_TRUE(config->run.autoMountRemote);
}

TEST_F(AppConfigTest, MissingFile) {
    std::string error;
    EXPECT_FALSE(loadConfig((root_ / "absent.json").string(), error).has_value());
    EXPECT_NE(error.find("not found"), std::string::npos);
}

TEST_F(AppConfigTest, ValidationErrors) {
    std::string error;

    write(R"({"remote_backup_dir": "B", "profiles": []})");
    EXPECT_FALSE(loadConfig(path_, error).has_value());
    EXPECT_EQ(error, "Missing key 'remote_path' in configuration file.");

    write(R"({"remote_path": "", "remote_backup_dir": "B", "profiles": []})");
    EXPECT_FALSE(loadConfig(path_, error).has_value());
    EXPECT_NE(error.find("non-empty list"), std::string::npos);

    write(R"({"remote_path": "", "remote_backup_dir": "B", "profiles": [{"id": "a", "name": "A", "sources": []}]})");
    EXPECT_FALSE(loadConfig(path_, error).has_value());
    EXPECT_EQ(error, "The first profile is missing the required key: 'container'");

    write(R"({"remote_path": "", "remote_backup_dir": "B", "network_quality": "great",
              "profiles": [{"id": "a", "name": "A", "container": "c", "sources": []}]})");
    EXPECT_FALSE(loadConfig(path_, error).has_value());
    EXPECT_NE(error.find("network_quality"), std::string::npos);

    write("{ not json");
    EXPECT_FALSE(loadConfig(path_, error).has_value());
    EXPECT_NE(error.find("Could not parse"), std::string::npos);
}

TEST_F(AppConfigTest, SaveThenLoad) {
    AppConfig config;
    config.baseDir = "/srv";
    config.run.remotePath = "/mnt/remote";
    config.run.remoteBackupDir = "Vaults";
    config.run.networkQuality = NetworkQuality::Terrible;
    config.logFile = (root_ / "log.txt").string();
    config.profiles.push_back({"main", "Main", "vault.hc", {"docs", "mail"}});

    const std::string nested = (root_ / "sub" / "config.json").string();
    std::string error;
    ASSERT_TRUE(saveConfig(config, nested, error)) << error;

    auto loaded = loadConfig(nested, error);
    ASSERT_TRUE(loaded.has_value()) << error;
    EXPECT_EQ(loaded->run.remotePath, "/mnt/remote");
    EXPECT_EQ(loaded->run.networkQuality, NetworkQuality::Terrible);
    EXPECT_EQ(loaded->profiles.front().sources, config.profiles.front().sources);
}

TEST_F(AppConfigTest, DefaultPathFollowsXdg) {
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = previous ? previous : "";

    ::setenv("XDG_CONFIG_HOME", root_.c_str(), 1);
    EXPECT_EQ(defaultConfigPath(), (root_ / "vaultrelay" / "config.json").string());

    if (previous) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}
