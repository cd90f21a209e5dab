#include "config/config.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace bridge::config;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("sse_bridge_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir);
        path = (dir / "sse_bridge.ini").string();
        set_config_file_path(path);
    }

    void TearDown() override {
        set_config_file_path("");
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void write_file(const std::string &content) {
        std::ofstream out(path);
        out << content;
    }

    std::filesystem::path dir;
    std::string path;
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    auto config = load_config(ConfigMode::STATIC).bridge;

    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.log_path.empty());
    EXPECT_EQ(config.reconnect_interval_ms, 5000u);
    EXPECT_EQ(config.max_line_size, 16u * 1024 * 1024);
    EXPECT_EQ(config.sse_path_suffix, "/sse");
    EXPECT_EQ(config.post_path_suffix, "/mcp");
    std::vector<std::string> methods{"connection/ready", "server/capabilities"};
    EXPECT_EQ(config.suppressed_methods, methods);
    EXPECT_TRUE(config.verify_tls);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ConfigTest, NoneModeIgnoresFile) {
    write_file("[bridge]\nreconnect_interval_ms=100\n");
    auto config = load_config(ConfigMode::NONE).bridge;
    EXPECT_EQ(config.reconnect_interval_ms, 5000u);
}

TEST_F(ConfigTest, LoadsValuesFromFile) {
    write_file("[bridge]\n"
               "log_level=debug\n"
               "reconnect_interval_ms=250\n"
               "max_line_size=4096\n"
               "max_event_size=8192\n"
               "shutdown_grace_ms=100\n"
               "sse_path_suffix=/events\n"
               "post_path_suffix=/rpc\n"
               "suppressed_methods=notifications/message, connection/ready\n"
               "verify_tls=0\n");

    auto config = load_config(ConfigMode::STATIC).bridge;

    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.reconnect_interval_ms, 250u);
    EXPECT_EQ(config.max_line_size, 4096u);
    EXPECT_EQ(config.max_event_size, 8192u);
    EXPECT_EQ(config.shutdown_grace_ms, 100u);
    EXPECT_EQ(config.sse_path_suffix, "/events");
    EXPECT_EQ(config.post_path_suffix, "/rpc");
    std::vector<std::string> methods{"notifications/message", "connection/ready"};
    EXPECT_EQ(config.suppressed_methods, methods);
    EXPECT_FALSE(config.verify_tls);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    write_file("[bridge]\nlog_level=warn\n");
    auto config = load_config(ConfigMode::STATIC).bridge;

    EXPECT_EQ(config.log_level, "warn");
    EXPECT_EQ(config.reconnect_interval_ms, 5000u);
    EXPECT_EQ(config.max_files, 3u);
    EXPECT_TRUE(config.verify_tls);
}

TEST_F(ConfigTest, WrittenDefaultsLoadBack) {
    write_default_config(path);
    ASSERT_TRUE(std::filesystem::exists(path));

    auto config = load_config(ConfigMode::STATIC).bridge;
    BridgeConfig defaults;
    EXPECT_EQ(config.reconnect_interval_ms, defaults.reconnect_interval_ms);
    EXPECT_EQ(config.max_event_size, defaults.max_event_size);
    EXPECT_EQ(config.suppressed_methods, defaults.suppressed_methods);
    EXPECT_EQ(config.log_path, "logs/sse_bridge.log");
}

TEST(ConfigPathTest, ExplicitPathWins) {
    set_config_file_path("/tmp/custom.ini");
    EXPECT_EQ(get_config_file_path(), "/tmp/custom.ini");
    set_config_file_path("");
    EXPECT_NE(get_config_file_path(), "/tmp/custom.ini");
    EXPECT_NE(get_config_file_path().find(CONFIG_FILE), std::string::npos);
}
