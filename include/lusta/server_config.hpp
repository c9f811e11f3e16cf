/**
 * @file server_config.hpp
 * @brief Limits, runtime configuration and input validation for LuStA
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "lusta/utilities.hpp"

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <optional>
#include <filesystem>

namespace lusta {
namespace limits {

// ============================================================================
// Frame and Content Limits
// ============================================================================

/// Maximum size of one inbound frame (64KB), larger frames are a protocol error
constexpr size_t MAX_FRAME_SIZE = 64 * 1024;

/// Maximum display name length (matches the user directory column width)
constexpr size_t MAX_USERNAME_LENGTH = 50;

/// Minimum password length accepted at registration
constexpr size_t MIN_PASSWORD_LENGTH = 1;

/// Default maximum message content length
constexpr size_t MAX_CONTENT_LENGTH = 16 * 1024;

// ============================================================================
// Connection Limits
// ============================================================================

/// Frames that may wait in one connection's outbound queue before pushes fail
constexpr size_t MAX_OUTBOUND_QUEUE = 256;

/// Time a closing connection may spend flushing its queue
constexpr auto CLOSE_LINGER = std::chrono::seconds(2);

/// Default listening port
constexpr uint16_t DEFAULT_PORT = 8000;

/// Largest configurable worker pool
constexpr size_t MAX_WORKER_THREADS = 256;

/// Largest configurable frame size and content length (16MB)
constexpr size_t MAX_CONFIGURED_FRAME_SIZE = 16 * 1024 * 1024;

/// Largest configurable outbound queue
constexpr size_t MAX_CONFIGURED_QUEUE = 65536;

// ============================================================================
// Rate Limiting
// ============================================================================

/// Frames per second per identity (sustained rate)
constexpr double RATE_LIMIT_PER_SECOND = 20.0;

/// Burst capacity per identity
constexpr double RATE_LIMIT_BURST = 40.0;

} // namespace limits

/**
 * @brief Business rules left open by the messaging model
 *
 * Defaults accept everything the original service accepted.
 */
struct MessagePolicy {
    bool allow_self_messages = true;                        ///< sender == receiver
    bool allow_empty_content = true;                        ///< "" as content
    size_t max_content_length = limits::MAX_CONTENT_LENGTH; ///< bytes, 0 = unlimited
};

/**
 * @brief Runtime configuration of lusta_server
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = limits::DEFAULT_PORT;
    std::string database_path;              ///< Empty: <data dir>/lusta.db
    std::string log_file;                   ///< Empty: console only
    utilities::LogLevel log_level = utilities::LogLevel::INFO;
    size_t worker_threads = 0;              ///< 0: hardware concurrency
    size_t max_frame_size = limits::MAX_FRAME_SIZE;
    size_t outbound_queue_limit = limits::MAX_OUTBOUND_QUEUE;
    double rate_limit_per_second = limits::RATE_LIMIT_PER_SECOND;
    double rate_limit_burst = limits::RATE_LIMIT_BURST;
    MessagePolicy policy;
};

namespace config {

/**
 * @brief Overlay a JSON configuration file on top of a base configuration
 * @param file_path Path to JSON file
 * @param base Configuration to start from
 * @return Merged configuration, or std::nullopt if the file is unreadable or invalid
 */
std::optional<ServerConfig> load_config_file(
    const std::string& file_path,
    const ServerConfig& base = ServerConfig{}
);

/**
 * @brief Overlay a JSON document given as text
 * @param json_text JSON object text
 * @param base Configuration to start from
 * @return Merged configuration, or std::nullopt if invalid
 */
std::optional<ServerConfig> parse_config(
    const std::string& json_text,
    const ServerConfig& base = ServerConfig{}
);

/**
 * @brief Apply LUSTA_* environment overrides in place
 * @param config Configuration to update
 */
void apply_environment(ServerConfig& config);

/**
 * @brief Get LuStA data directory from LUSTA_DATA_DIR or ./lusta-data
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Database path to open for a configuration
 * @param config Server configuration
 * @return config.database_path, or the default inside the data directory
 */
std::string resolve_database_path(const ServerConfig& config);

/**
 * @brief Validate display name (alphanumeric plus underscore, hyphen, dot)
 * @param username Name to validate
 * @return true if valid, false otherwise
 */
bool validate_username(const std::string& username);

} // namespace config
} // namespace lusta
