/**
 * @file utilities.hpp
 * @brief Common utility functions for LuStA
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout LuStA:
 * - Logging and error reporting
 * - Wall clock and timestamp formatting
 * - String manipulation
 * - Environment helpers
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace lusta {
namespace utilities {

/**
 * @brief Log levels for LuStA logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name (debug, info, warn, error, critical)
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Current wall clock time
 * @return Milliseconds since the Unix epoch
 */
int64_t current_time_ms();

/**
 * @brief Format millisecond timestamp as ISO 8601 UTC string
 * @param timestamp_ms Milliseconds since the Unix epoch
 * @return Formatted string (e.g., "2025-11-10T15:30:45.123Z")
 */
std::string format_timestamp_ms(int64_t timestamp_ms);

/**
 * @brief Trim whitespace from string
 * @param str String to trim
 * @return Trimmed string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 * @param str String to convert
 * @return Lowercase string
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace lusta
