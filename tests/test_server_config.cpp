/**
 * @file test_server_config.cpp
 * @brief Unit tests for configuration loading and validation
 *
 * Tests configuration including:
 * - Defaults
 * - JSON overlay
 * - Environment overrides
 * - Display name validation
 */

#include <gtest/gtest.h>
#include "lusta/server_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace lusta;
namespace fs = std::filesystem;

// Test fixture for configuration tests
class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "lusta_config_test";
        fs::create_directories(test_dir_);
        clear_environment();
    }

    void TearDown() override {
        clear_environment();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    void clear_environment() {
        unsetenv("LUSTA_HOST");
        unsetenv("LUSTA_PORT");
        unsetenv("LUSTA_DB_PATH");
        unsetenv("LUSTA_LOG_FILE");
        unsetenv("LUSTA_LOG_LEVEL");
        unsetenv("LUSTA_DATA_DIR");
    }

    fs::path test_dir_;
};

// ============================================================================
// Default Tests
// ============================================================================

TEST_F(ServerConfigTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, limits::DEFAULT_PORT);
    EXPECT_EQ(config.max_frame_size, limits::MAX_FRAME_SIZE);
    EXPECT_EQ(config.outbound_queue_limit, limits::MAX_OUTBOUND_QUEUE);
    EXPECT_TRUE(config.policy.allow_self_messages);
    EXPECT_TRUE(config.policy.allow_empty_content);
}

// ============================================================================
// JSON Overlay Tests
// ============================================================================

TEST_F(ServerConfigTest, ParseOverridesOnlyGivenKeys) {
    auto config = config::parse_config(R"({
        "port": 9100,
        "log_level": "debug",
        "rate_limit": {"per_second": 5, "burst": 10},
        "policy": {"allow_self_messages": false, "max_content_length": 100}
    })");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 9100);
    EXPECT_EQ(config->host, "0.0.0.0");
    EXPECT_EQ(config->log_level, utilities::LogLevel::DEBUG);
    EXPECT_DOUBLE_EQ(config->rate_limit_per_second, 5.0);
    EXPECT_DOUBLE_EQ(config->rate_limit_burst, 10.0);
    EXPECT_FALSE(config->policy.allow_self_messages);
    EXPECT_TRUE(config->policy.allow_empty_content);
    EXPECT_EQ(config->policy.max_content_length, 100u);
}

TEST_F(ServerConfigTest, ParseKeepsBaseValues) {
    ServerConfig base;
    base.database_path = "/tmp/base.db";

    auto config = config::parse_config(R"({"host": "127.0.0.1"})", base);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->host, "127.0.0.1");
    EXPECT_EQ(config->database_path, "/tmp/base.db");
}

TEST_F(ServerConfigTest, ParseRejectsInvalidDocuments) {
    EXPECT_FALSE(config::parse_config("not json").has_value());
    EXPECT_FALSE(config::parse_config("[1, 2]").has_value());
    EXPECT_FALSE(config::parse_config(R"({"port": "eighty"})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"log_level": "loud"})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"max_frame_size": 0})").has_value());
}

TEST_F(ServerConfigTest, ParseRejectsOutOfRangeNumbers) {
    EXPECT_FALSE(config::parse_config(R"({"port": 70000})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"port": -1})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"worker_threads": -1})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"worker_threads": 100000})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"outbound_queue_limit": -5})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"max_frame_size": 18446744073709551615})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"policy": {"max_content_length": -1}})").has_value());
    EXPECT_FALSE(config::parse_config(R"({"worker_threads": 1.5})").has_value());
}

TEST_F(ServerConfigTest, ParseAcceptsRangeBoundaries) {
    auto config = config::parse_config(R"({"port": 65535, "worker_threads": 0, "max_frame_size": 1})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 65535);
    EXPECT_EQ(config->worker_threads, 0u);
    EXPECT_EQ(config->max_frame_size, 1u);
}

TEST_F(ServerConfigTest, LoadConfigFile) {
    fs::path file = test_dir_ / "lusta.json";
    {
        std::ofstream out(file);
        out << R"({"port": 0, "database_path": "chat.db"})";
    }

    auto config = config::load_config_file(file.string());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 0);
    EXPECT_EQ(config->database_path, "chat.db");
}

TEST_F(ServerConfigTest, LoadMissingConfigFile) {
    EXPECT_FALSE(config::load_config_file((test_dir_ / "missing.json").string()).has_value());
}

// ============================================================================
// Environment Tests
// ============================================================================

TEST_F(ServerConfigTest, EnvironmentOverrides) {
    setenv("LUSTA_HOST", "127.0.0.1", 1);
    setenv("LUSTA_PORT", "8123", 1);
    setenv("LUSTA_DB_PATH", "/tmp/env.db", 1);
    setenv("LUSTA_LOG_LEVEL", "error", 1);

    ServerConfig config;
    config::apply_environment(config);

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8123);
    EXPECT_EQ(config.database_path, "/tmp/env.db");
    EXPECT_EQ(config.log_level, utilities::LogLevel::ERROR);
}

TEST_F(ServerConfigTest, InvalidEnvironmentIgnored) {
    setenv("LUSTA_PORT", "99999", 1);
    setenv("LUSTA_LOG_LEVEL", "chatty", 1);

    ServerConfig config;
    config::apply_environment(config);

    EXPECT_EQ(config.port, limits::DEFAULT_PORT);
    EXPECT_EQ(config.log_level, utilities::LogLevel::INFO);
}

TEST_F(ServerConfigTest, DefaultDatabaseInDataDirectory) {
    setenv("LUSTA_DATA_DIR", (test_dir_ / "data").string().c_str(), 1);

    ServerConfig config;
    std::string path = config::resolve_database_path(config);

    EXPECT_EQ(path, (test_dir_ / "data" / "lusta.db").string());
    EXPECT_TRUE(fs::exists(test_dir_ / "data"));
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ServerConfigTest, ValidateUsername) {
    EXPECT_TRUE(config::validate_username("alice"));
    EXPECT_TRUE(config::validate_username("bob_42"));
    EXPECT_TRUE(config::validate_username("carol.smith-jr"));
    EXPECT_TRUE(config::validate_username(std::string(limits::MAX_USERNAME_LENGTH, 'a')));
}

TEST_F(ServerConfigTest, ValidateUsernameRejects) {
    EXPECT_FALSE(config::validate_username(""));
    EXPECT_FALSE(config::validate_username("has space"));
    EXPECT_FALSE(config::validate_username("semi;colon"));
    EXPECT_FALSE(config::validate_username(std::string(limits::MAX_USERNAME_LENGTH + 1, 'a')));
}
