/**
 * @file lusta_client.cpp
 * @brief Interactive command line client for a LuStA server
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates the wire protocol:
 * - Login or register handshake
 * - Sending direct messages
 * - Presence and conversation queries
 */

#include "lusta/utilities.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using json = nlohmann::json;
using namespace lusta::utilities;

static std::atomic<bool> g_shutdown(false);

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <host> <port> <login|register> <username> <password>\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " 127.0.0.1 8000 register alice secret\n";
    std::cout << "  " << program_name << " 127.0.0.1 8000 login bob hunter2\n\n";
}

// Print help menu
void print_help() {
    std::cout << "\nCommands:\n";
    std::cout << "  msg <user> <text>   - Send direct message\n";
    std::cout << "  online              - List online users\n";
    std::cout << "  users               - List registered users\n";
    std::cout << "  chats               - List conversations\n";
    std::cout << "  history <user>      - Show conversation (marks received messages read)\n";
    std::cout << "  help                - Show this help\n";
    std::cout << "  quit / exit         - Disconnect\n\n";
}

// Render one server frame for the terminal
void print_frame(const std::string& line) {
    json frame = json::parse(line, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        std::cout << "\n<<< " << line << "\n> ";
        std::cout.flush();
        return;
    }

    std::string type = frame.value("type", "");

    if (type == "new_message") {
        std::cout << "\n>>> " << frame.value("from", "?") << ": " << frame.value("message", "") << "\n";
    } else if (type == "message_sent") {
        std::cout << "\n[OK] Message " << frame.value("message_id", 0) << " to "
                  << frame.value("to", "?") << "\n";
    } else if (type == "authenticated") {
        std::cout << "\n[OK] Authenticated as " << frame.value("username", "?")
                  << " (ID: " << frame.value("user_id", 0) << ")\n";
    } else if (type == "error") {
        std::cout << "\n[FAIL] " << frame.value("code", "") << ": " << frame.value("message", "") << "\n";
    } else if (type == "close") {
        std::cout << "\nServer closed connection: " << frame.value("reason", "") << "\n";
    } else if (type == "messages") {
        std::cout << "\n";
        for (const auto& message : frame.value("messages", json::array())) {
            std::cout << "  [" << message.value("timestamp", "") << "] "
                      << message.value("sender_username", "?") << ": "
                      << message.value("content", "") << " ("
                      << message.value("delivery_state", "") << ")\n";
        }
    } else {
        std::cout << "\n" << frame.dump(2) << "\n";
    }

    std::cout << "> ";
    std::cout.flush();
}

// Build the frame for one command, returns empty string if nothing to send
std::string build_frame(const std::string& command_line, bool& quit) {
    std::istringstream iss(command_line);
    std::string cmd;
    iss >> cmd;

    if (cmd.empty()) {
        return "";
    }

    if (cmd == "quit" || cmd == "exit") {
        quit = true;
        return "";
    }
    if (cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
        return "";
    }
    if (cmd == "online") {
        return json{{"action", "get_online_users"}}.dump();
    }
    if (cmd == "users") {
        return json{{"action", "list_users"}}.dump();
    }
    if (cmd == "chats") {
        return json{{"action", "get_chats"}}.dump();
    }
    if (cmd == "history") {
        std::string user;
        iss >> user;
        if (user.empty()) {
            std::cout << "Usage: history <user>\n";
            return "";
        }
        return json{{"action", "get_messages"}, {"with", user}}.dump();
    }
    if (cmd == "msg") {
        std::string user, message;
        iss >> user;
        std::getline(iss, message);
        message = trim_string(message);
        if (user.empty() || message.empty()) {
            std::cout << "Usage: msg <user> <text>\n";
            return "";
        }
        return json{{"action", "send_message"}, {"to", user}, {"message", message}}.dump();
    }

    std::cout << "Unknown command: " << cmd << "\n";
    std::cout << "Type 'help' for available commands\n";
    return "";
}

int main(int argc, char* argv[]) {
    if (argc < 6) {
        print_usage(argv[0]);
        return 1;
    }

    std::string host = argv[1];
    std::string port = argv[2];
    std::string action = argv[3];
    std::string username = argv[4];
    std::string password = argv[5];

    if (action != "login" && action != "register") {
        print_usage(argv[0]);
        return 1;
    }

    initialize_logging("", LogLevel::WARN);

    try {
        asio::io_context io_context;
        asio::ip::tcp::resolver resolver(io_context);
        asio::ip::tcp::socket socket(io_context);
        asio::connect(socket, resolver.resolve(host, port));

        std::string handshake = json{
            {"action", action},
            {"username", username},
            {"password", password}
        }.dump() + "\n";
        asio::write(socket, asio::buffer(handshake));

        // Reader thread prints every frame the server pushes
        std::thread reader([&socket]() {
            asio::streambuf buffer;
            asio::error_code error;
            while (!g_shutdown) {
                asio::read_until(socket, buffer, '\n', error);
                if (error) {
                    break;
                }
                std::istream stream(&buffer);
                std::string line;
                std::getline(stream, line);
                print_frame(line);
            }
            if (!g_shutdown) {
                std::cout << "\nDisconnected. Press Enter to exit.\n";
            }
            g_shutdown = true;
        });

        print_help();

        std::string line;
        while (!g_shutdown && std::cout << "> " && std::getline(std::cin, line)) {
            bool quit = false;
            std::string frame = build_frame(line, quit);
            if (quit) {
                break;
            }
            if (!frame.empty()) {
                asio::error_code error;
                asio::write(socket, asio::buffer(frame + "\n"), error);
                if (error) {
                    std::cerr << "Send failed: " << error.message() << "\n";
                    break;
                }
            }
        }

        g_shutdown = true;
        asio::error_code ec;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);

        if (reader.joinable()) {
            reader.join();
        }

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
