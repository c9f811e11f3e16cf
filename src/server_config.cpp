/**
 * @file server_config.cpp
 * @brief Implementation of configuration loading and validation
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lusta/server_config.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace lusta {
namespace config {

using namespace lusta::utilities;

namespace {

    /**
     * @brief Read an optional integer key within [min_value, max_value]
     * @return false if the key is present but not an integer in range
     */
    template <typename T>
    bool read_integer(const json& j, const char* key, int64_t min_value, int64_t max_value, T& out) {
        auto it = j.find(key);
        if (it == j.end()) {
            return true;
        }

        if (!it->is_number_integer()) {
            log_error(std::string("Configuration value '") + key + "' must be an integer");
            return false;
        }

        // Values beyond int64 range arrive as unsigned and are rejected here
        if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(max_value)) {
            log_error(std::string("Configuration value '") + key + "' out of range");
            return false;
        }

        int64_t value = it->get<int64_t>();
        if (value < min_value || value > max_value) {
            log_error(std::string("Configuration value '") + key + "' out of range: " + std::to_string(value));
            return false;
        }

        out = static_cast<T>(value);
        return true;
    }

} // namespace

// ============================================================================
// File Configuration
// ============================================================================

std::optional<ServerConfig> parse_config(const std::string& json_text, const ServerConfig& base) {
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            log_error("Configuration must be a JSON object");
            return std::nullopt;
        }

        ServerConfig config = base;

        if (j.contains("host")) config.host = j["host"].get<std::string>();
        if (j.contains("database_path")) config.database_path = j["database_path"].get<std::string>();
        if (j.contains("log_file")) config.log_file = j["log_file"].get<std::string>();

        if (!read_integer(j, "port", 0, 65535, config.port) ||
            !read_integer(j, "worker_threads", 0, limits::MAX_WORKER_THREADS, config.worker_threads) ||
            !read_integer(j, "max_frame_size", 1, limits::MAX_CONFIGURED_FRAME_SIZE, config.max_frame_size) ||
            !read_integer(j, "outbound_queue_limit", 1, limits::MAX_CONFIGURED_QUEUE,
                          config.outbound_queue_limit)) {
            return std::nullopt;
        }

        if (j.contains("log_level")) {
            auto level = parse_log_level(j["log_level"].get<std::string>());
            if (!level) {
                log_error("Unknown log level in configuration: " + j["log_level"].get<std::string>());
                return std::nullopt;
            }
            config.log_level = *level;
        }

        if (j.contains("rate_limit")) {
            const auto& rate = j["rate_limit"];
            if (rate.contains("per_second")) config.rate_limit_per_second = rate["per_second"].get<double>();
            if (rate.contains("burst")) config.rate_limit_burst = rate["burst"].get<double>();
        }

        if (j.contains("policy")) {
            const auto& policy = j["policy"];
            if (policy.contains("allow_self_messages")) {
                config.policy.allow_self_messages = policy["allow_self_messages"].get<bool>();
            }
            if (policy.contains("allow_empty_content")) {
                config.policy.allow_empty_content = policy["allow_empty_content"].get<bool>();
            }
            if (!read_integer(policy, "max_content_length", 0, limits::MAX_CONFIGURED_FRAME_SIZE,
                              config.policy.max_content_length)) {
                return std::nullopt;
            }
        }

        return config;

    } catch (const json::exception& e) {
        log_error("Invalid configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<ServerConfig> load_config_file(const std::string& file_path, const ServerConfig& base) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        log_error("Failed to open configuration file: " + file_path);
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();

    auto config = parse_config(content.str(), base);
    if (config) {
        log_info("Loaded configuration from " + file_path);
    }
    return config;
}

// ============================================================================
// Environment Overrides
// ============================================================================

void apply_environment(ServerConfig& config) {
    std::string host = get_env("LUSTA_HOST");
    if (!host.empty()) {
        config.host = host;
    }

    std::string port = get_env("LUSTA_PORT");
    if (!port.empty()) {
        try {
            unsigned long value = std::stoul(port);
            if (value > 65535) {
                throw std::out_of_range("port");
            }
            config.port = static_cast<uint16_t>(value);
        } catch (const std::exception&) {
            log_warn("Ignoring invalid LUSTA_PORT: " + port);
        }
    }

    std::string db_path = get_env("LUSTA_DB_PATH");
    if (!db_path.empty()) {
        config.database_path = db_path;
    }

    std::string log_file = get_env("LUSTA_LOG_FILE");
    if (!log_file.empty()) {
        config.log_file = log_file;
    }

    std::string level = get_env("LUSTA_LOG_LEVEL");
    if (!level.empty()) {
        auto parsed = parse_log_level(level);
        if (parsed) {
            config.log_level = *parsed;
        } else {
            log_warn("Ignoring invalid LUSTA_LOG_LEVEL: " + level);
        }
    }
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    std::filesystem::path data_dir(get_env("LUSTA_DATA_DIR", "lusta-data"));

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

std::string resolve_database_path(const ServerConfig& config) {
    if (!config.database_path.empty()) {
        return config.database_path;
    }
    return (get_data_directory() / "lusta.db").string();
}

// ============================================================================
// Validation
// ============================================================================

bool validate_username(const std::string& username) {
    if (username.empty() || username.length() > limits::MAX_USERNAME_LENGTH) {
        return false;
    }

    for (char c : username) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }

    return true;
}

} // namespace config
} // namespace lusta
