/**
 * @file chat_server.hpp
 * @brief LuStA server - accepts connections and wires them to the router
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * ChatServer coordinates all subsystems:
 * - TCP acceptor and worker thread pool (Asio)
 * - Authentication and user directory
 * - Presence registry and router
 * - Conversation queries over the message store
 */

#pragma once

#include "lusta/auth_service.hpp"
#include "lusta/chat_summary_aggregator.hpp"
#include "lusta/connection_session.hpp"
#include "lusta/message_store.hpp"
#include "lusta/password_hasher.hpp"
#include "lusta/presence_registry.hpp"
#include "lusta/query_service.hpp"
#include "lusta/router.hpp"
#include "lusta/server_config.hpp"

#include <asio.hpp>
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace lusta {

/**
 * @brief ChatServer - Real-time direct messaging server
 *
 * The message store is owned by the caller and must outlive the server.
 */
class ChatServer {
public:
    /**
     * @brief Construct server over a message store
     * @param config Runtime configuration (port 0 picks an ephemeral port)
     * @param store Durable store for users and messages
     * @param hasher Password hasher used for registration and login
     */
    ChatServer(
        ServerConfig config,
        MessageStore& store,
        PasswordHasher hasher = PasswordHasher()
    );

    /**
     * @brief Destructor - graceful shutdown
     */
    ~ChatServer();

    // Disable copy and move
    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;
    ChatServer(ChatServer&&) = delete;
    ChatServer& operator=(ChatServer&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Bind the listening socket and start worker threads
     * @return true if started successfully, false otherwise
     */
    bool start();

    /**
     * @brief Close every connection with reason shutdown and stop workers
     */
    void stop();

    /**
     * @brief Block until stop() is called
     */
    void run();

    bool is_running() const;

    /**
     * @brief Bound listening port (valid after start)
     */
    uint16_t port() const;

    size_t connection_count() const;

    PresenceRegistry& registry() { return registry_; }

private:
    ServerConfig config_;
    MessageStore& store_;

    PresenceRegistry registry_;
    AuthService auth_;
    ChatSummaryAggregator aggregator_;
    QueryService queries_;
    Router router_;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<std::thread> worker_threads_;

    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<ConnectionId> next_connection_id_{1};

    /// Live sessions by connection id
    std::map<ConnectionId, std::shared_ptr<ConnectionSession>> sessions_;
    mutable std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;

    std::mutex run_mutex_;
    std::condition_variable run_cv_;

    void start_accept();
    void handle_accept(const asio::error_code& error, asio::ip::tcp::socket socket);
    void remove_session(ConnectionId id);
};

} // namespace lusta
