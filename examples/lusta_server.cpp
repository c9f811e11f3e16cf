/**
 * @file lusta_server.cpp
 * @brief LuStA messaging server executable
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Configuration is layered, later sources win:
 * - Built-in defaults
 * - JSON file given with --config
 * - LUSTA_* environment variables
 * - Command line flags
 */

#include "lusta/chat_server.hpp"
#include "lusta/password_hasher.hpp"
#include "lusta/server_config.hpp"
#include "lusta/sqlite_message_store.hpp"
#include "lusta/utilities.hpp"

#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace lusta;
using namespace lusta::utilities;

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>       JSON configuration file\n";
    std::cout << "  --host <address>      Listen address (default: 0.0.0.0)\n";
    std::cout << "  --port <port>         Listen port (default: 8000, 0 = any)\n";
    std::cout << "  --db <path>           SQLite database (default: <data dir>/lusta.db)\n";
    std::cout << "  --log-file <path>     Also log to rotating file\n";
    std::cout << "  --log-level <level>   debug, info, warn, error, critical\n";
    std::cout << "  --threads <n>         Worker threads (default: hardware concurrency)\n";
    std::cout << "  --help                Show this help\n\n";
    std::cout << "Environment:\n";
    std::cout << "  LUSTA_HOST, LUSTA_PORT, LUSTA_DB_PATH, LUSTA_LOG_FILE, LUSTA_LOG_LEVEL, LUSTA_DATA_DIR\n\n";
}

// Apply command line flags on top of config, returns false on bad usage
bool apply_arguments(int argc, char* argv[], ServerConfig& config, bool& show_help) {
    std::optional<std::string> config_file;

    // First pass: config file, so flags can override it
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        }
    }

    if (config_file) {
        auto loaded = config::load_config_file(*config_file, config);
        if (!loaded) {
            std::cerr << "Invalid configuration file: " << *config_file << "\n";
            return false;
        }
        config = *loaded;
    }

    config::apply_environment(config);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
            return true;
        }

        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        std::string value = argv[++i];

        try {
            if (arg == "--config") {
                continue;
            } else if (arg == "--host") {
                config.host = value;
            } else if (arg == "--port") {
                int port = std::stoi(value);
                if (port < 0 || port > 65535) {
                    std::cerr << "Port out of range: " << value << "\n";
                    return false;
                }
                config.port = static_cast<uint16_t>(port);
            } else if (arg == "--db") {
                config.database_path = value;
            } else if (arg == "--log-file") {
                config.log_file = value;
            } else if (arg == "--log-level") {
                auto level = parse_log_level(value);
                if (!level) {
                    std::cerr << "Unknown log level: " << value << "\n";
                    return false;
                }
                config.log_level = *level;
            } else if (arg == "--threads") {
                long long threads = std::stoll(value);
                if (threads < 0 || threads > static_cast<long long>(limits::MAX_WORKER_THREADS)) {
                    std::cerr << "Thread count out of range: " << value << "\n";
                    return false;
                }
                config.worker_threads = static_cast<size_t>(threads);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << ": " << value << "\n";
            return false;
        }
    }

    return true;
}

int main(int argc, char* argv[]) {
    ServerConfig config;
    bool show_help = false;

    if (!apply_arguments(argc, argv, config, show_help)) {
        print_usage(argv[0]);
        return 1;
    }
    if (show_help) {
        print_usage(argv[0]);
        return 0;
    }

    // Initialize logging
    initialize_logging(config.log_file, config.log_level);

    if (!PasswordHasher::initialize()) {
        log_critical("libsodium initialization failed");
        return 1;
    }

    try {
        std::string database_path = config::resolve_database_path(config);
        log_info("Opening database " + database_path);
        SqliteMessageStore store(database_path);

        ChatServer server(config, store);
        if (!server.start()) {
            log_critical("Failed to start server");
            return 1;
        }

        // Signals are handled on a dedicated context so stop() runs outside the handler
        asio::io_context signal_context;
        asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([&server](const asio::error_code& error, int signal_number) {
            if (!error) {
                log_info("Received signal " + std::to_string(signal_number) + ", shutting down...");
                server.stop();
            }
        });

        std::thread signal_thread([&signal_context]() {
            signal_context.run();
        });

        server.run();

        signal_context.stop();
        if (signal_thread.joinable()) {
            signal_thread.join();
        }

        log_info("Server stopped");

    } catch (const std::exception& e) {
        log_critical("Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
