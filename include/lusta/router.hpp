/**
 * @file router.hpp
 * @brief Per-connection protocol state machine
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Interprets inbound frames and decides persist, route or reject:
 * - Connecting: login/register handshake through AuthService
 * - Active: send_message, get_online_users and the query actions
 * - Closed: terminal, frames are dropped
 *
 * Messages are always persisted before any push is attempted. Push
 * failures are logged and swallowed; persistence failures are reported
 * to the sender.
 */

#pragma once

#include "lusta/auth_service.hpp"
#include "lusta/connection.hpp"
#include "lusta/message_store.hpp"
#include "lusta/presence_registry.hpp"
#include "lusta/protocol.hpp"
#include "lusta/query_service.hpp"
#include "lusta/rate_limiter.hpp"
#include "lusta/server_config.hpp"

#include <memory>
#include <optional>
#include <string>

namespace lusta {

/**
 * @brief Lifecycle of one connection as seen by the router
 */
enum class SessionState {
    CONNECTING,
    AUTHENTICATED,
    ACTIVE,
    CLOSED
};

std::string session_state_to_string(SessionState state);

/**
 * @brief Router state for one connection
 *
 * Owned by the transport; only touched from that connection's
 * sequential frame processing.
 */
struct ConnectionContext {
    explicit ConnectionContext(ConnectionPtr conn)
        : connection(std::move(conn))
    {}

    ConnectionPtr connection;
    SessionState state = SessionState::CONNECTING;
    std::optional<Identity> identity;       ///< Set once authenticated
    int64_t last_message_time = 0;          ///< created_at of the last message sent here
};

/**
 * @brief Router tuning
 */
struct RouterOptions {
    MessagePolicy policy;
    double rate_limit_per_second = limits::RATE_LIMIT_PER_SECOND;  ///< <= 0 disables limiting
    double rate_limit_burst = limits::RATE_LIMIT_BURST;

    static RouterOptions from_config(const ServerConfig& config);
};

/**
 * @brief Router - protocol state machine shared by all connections
 *
 * Thread-safe: shared state lives in PresenceRegistry and MessageStore;
 * per-connection state lives in ConnectionContext.
 */
class Router {
public:
    Router(
        PresenceRegistry& registry,
        MessageStore& store,
        AuthService& auth,
        QueryService& queries,
        RouterOptions options = RouterOptions()
    );

    // Disable copy and move
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /**
     * @brief Process one inbound frame
     * @param context Connection the frame arrived on
     * @param raw Frame text without delimiter
     */
    void handle_frame(ConnectionContext& context, const std::string& raw);

    /**
     * @brief Transport reports the connection is gone
     *
     * Deregisters the identity (unless already replaced) and moves the
     * context to CLOSED. Delivery states are not touched.
     */
    void on_disconnect(ConnectionContext& context);

    const RouterOptions& options() const { return options_; }

private:
    PresenceRegistry& registry_;
    MessageStore& store_;
    AuthService& auth_;
    QueryService& queries_;
    RouterOptions options_;
    std::unique_ptr<RateLimiter> rate_limiter_;

    void handle_handshake(ConnectionContext& context, const InboundFrame& frame);
    void handle_send_message(ConnectionContext& context, const InboundFrame& frame);
    void handle_get_online_users(ConnectionContext& context);
    void handle_get_messages(ConnectionContext& context, const InboundFrame& frame);

    /**
     * @brief Check content against the message policy
     * @return Rejection reason, or std::nullopt if allowed
     */
    std::optional<std::string> check_policy(
        const Identity& sender,
        const Identity& recipient,
        const std::string& content
    ) const;

    void reply(ConnectionContext& context, const std::string& frame);
    void close_connection(ConnectionContext& context, CloseReason reason);
    void release_presence(ConnectionContext& context);
};

} // namespace lusta
