#include <gtest/gtest.h>

#include "plugin-config.hpp"

#include <cstdio>
#include <filesystem>

class PluginConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("ble-heart-config-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir);
        path = (dir / "config.json").string();
    }
    void TearDown() override { std::filesystem::remove_all(dir); }

    std::filesystem::path dir;
    std::string path;
};

TEST_F(PluginConfigTest, MissingFileGivesDefaultsAndIsCreated) {
    PluginConfig config = LoadPluginConfig(path);
    EXPECT_TRUE(config.last_device_id.empty());
    EXPECT_TRUE(config.auto_connect);
    EXPECT_EQ(config.scan_timeout_seconds, 10);
    EXPECT_TRUE(config.filter_heart_rate_service);
    EXPECT_EQ(config.max_reconnect_attempts, 5);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(PluginConfigTest, SavedValuesLoadBack) {
    PluginConfig config;
    config.last_device_id = "246813579";
    config.auto_connect = false;
    config.scan_timeout_seconds = 20;
    config.filter_heart_rate_service = false;
    config.max_reconnect_attempts = 0;
    ASSERT_TRUE(SavePluginConfig(config, path));

    PluginConfig loaded = LoadPluginConfig(path);
    EXPECT_EQ(loaded.last_device_id, "246813579");
    EXPECT_FALSE(loaded.auto_connect);
    EXPECT_EQ(loaded.scan_timeout_seconds, 20);
    EXPECT_FALSE(loaded.filter_heart_rate_service);
    EXPECT_EQ(loaded.max_reconnect_attempts, 0);
}

TEST_F(PluginConfigTest, ScanTimeoutIsClamped) {
    PluginConfig config;
    config.scan_timeout_seconds = 600;
    ASSERT_TRUE(SavePluginConfig(config, path));

    PluginConfig loaded = LoadPluginConfig(path);
    EXPECT_EQ(loaded.scan_timeout_seconds, 60);
    EXPECT_EQ(loaded.ToSessionConfig().scan_timeout, std::chrono::seconds(60));
}

TEST(PluginConfig, SessionConfigDefaults) {
    SessionConfig session = PluginConfig{}.ToSessionConfig();
    EXPECT_EQ(session.scan_timeout, std::chrono::seconds(10));
    EXPECT_TRUE(session.filter_heart_rate_service);
    EXPECT_EQ(session.max_reconnect_attempts, 5);
}
