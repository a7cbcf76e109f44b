/**
 * management_config_test.cpp - Proxy config.yaml and management key handling
 */

#include "proxy/management_config.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace proxyvisor;
using namespace proxyvisor::proxy;

class ManagementConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    std::string config_path;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "proxyvisor_mgmt_config_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        config_path = (temp_dir / "config.yaml").string();
    }

    void TearDown() override { fs::remove_all(temp_dir); }

    std::string read_all(const std::string &path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    mode_t mode_of(const std::string &path) {
        struct stat st;
        EXPECT_EQ(stat(path.c_str(), &st), 0);
        return st.st_mode & 0777;
    }

    ManagementConfig defaults() {
        ManagementConfig config;
        config.port = 8317;
        config.auth_dir = "/home/user/.cli-proxy-api";
        config.management_secret = "secret-123";
        config.api_keys = {"proxyvisor-local-abc"};
        return config;
    }
};

TEST_F(ManagementConfigTest, RenderedConfigParsesBack) {
    auto config = defaults();
    config.routing_strategy = "fill-first";
    config.retry.request_retry = 5;

    ManagementConfig parsed;
    std::string error;
    ASSERT_TRUE(parse_management_config(render_management_config(config), parsed, error)) << error;

    EXPECT_EQ(parsed.host, "127.0.0.1");
    EXPECT_EQ(parsed.port, 8317);
    EXPECT_EQ(parsed.auth_dir, "/home/user/.cli-proxy-api");
    EXPECT_EQ(parsed.management_secret, "secret-123");
    ASSERT_EQ(parsed.api_keys.size(), 1u);
    EXPECT_EQ(parsed.api_keys[0], "proxyvisor-local-abc");
    EXPECT_FALSE(parsed.allow_remote_management);
    EXPECT_EQ(parsed.routing_strategy, "fill-first");
    EXPECT_EQ(parsed.retry.request_retry, 5);
}

TEST_F(ManagementConfigTest, EnsureCreatesOwnerOnlyFile) {
    bool created = false;
    ASSERT_TRUE(ensure_management_config(config_path, defaults(), created));

    EXPECT_TRUE(created);
    EXPECT_EQ(mode_of(config_path), 0600u);
    EXPECT_EQ(read_config_port(config_path), std::optional<int>(8317));
}

TEST_F(ManagementConfigTest, EnsureKeepsExistingFileAndTightensMode) {
    {
        std::ofstream out(config_path);
        out << "port: 9999\nauth-dir: \"/custom\"\n";
    }
    chmod(config_path.c_str(), 0644);

    bool created = true;
    ASSERT_TRUE(ensure_management_config(config_path, defaults(), created));

    EXPECT_FALSE(created);
    EXPECT_EQ(mode_of(config_path), 0600u);
    EXPECT_EQ(read_config_port(config_path), std::optional<int>(9999));
}

TEST_F(ManagementConfigTest, UpdatePortPreservesOtherLines) {
    {
        std::ofstream out(config_path);
        out << "host: \"127.0.0.1\"\n"
            << "# hand-written comment\n"
            << "port: 8317\n"
            << "remote-management:\n"
            << "  port: 1\n"
            << "debug: true\n";
    }

    ASSERT_TRUE(update_config_port(config_path, 18400));

    EXPECT_EQ(read_all(config_path), "host: \"127.0.0.1\"\n"
                                     "# hand-written comment\n"
                                     "port: 18400\n"
                                     "remote-management:\n"
                                     "  port: 1\n"
                                     "debug: true\n");
    EXPECT_EQ(mode_of(config_path), 0600u);
}

TEST_F(ManagementConfigTest, UpdatePortAppendsWhenMissing) {
    {
        std::ofstream out(config_path);
        out << "debug: false\n";
    }

    ASSERT_TRUE(update_config_port(config_path, 20000));
    EXPECT_EQ(read_config_port(config_path), std::optional<int>(20000));
}

TEST_F(ManagementConfigTest, UpdatePortRejectsOutOfRange) {
    bool created = false;
    ASSERT_TRUE(ensure_management_config(config_path, defaults(), created));

    auto status = update_config_port(config_path, 80);
    EXPECT_EQ(status.code(), common::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(update_config_port(config_path, 70000).code(), common::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(read_config_port(config_path), std::optional<int>(8317));
}

TEST_F(ManagementConfigTest, UpdatePortWithoutConfig) {
    auto status = update_config_port(config_path, 9000);
    EXPECT_EQ(status.code(), common::ErrorCode::PRECONDITION_FAILED);
}

TEST_F(ManagementConfigTest, ReadPortFromMissingOrBrokenFile) {
    EXPECT_FALSE(read_config_port(config_path).has_value());

    {
        std::ofstream out(config_path);
        out << "- just\n- a list\n";
    }
    EXPECT_FALSE(read_config_port(config_path).has_value());
}

TEST_F(ManagementConfigTest, ManagementKeyIsGeneratedOnceAndReused) {
    const std::string key_path = (temp_dir / "management_key").string();

    std::string first;
    ASSERT_TRUE(load_or_create_management_key(key_path, first));
    EXPECT_EQ(first.size(), 64u);
    EXPECT_EQ(mode_of(key_path), 0600u);

    std::string second;
    ASSERT_TRUE(load_or_create_management_key(key_path, second));
    EXPECT_EQ(first, second);
}

TEST_F(ManagementConfigTest, EmptyKeyFileIsRegenerated) {
    const std::string key_path = (temp_dir / "management_key").string();
    { std::ofstream out(key_path); }

    std::string key;
    ASSERT_TRUE(load_or_create_management_key(key_path, key));
    EXPECT_EQ(key.size(), 64u);
}

TEST(ManagementKeyTest, GeneratedKeysDiffer) {
    EXPECT_NE(generate_management_key(), generate_management_key());
}
