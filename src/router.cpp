/**
 * @file router.cpp
 * @brief Implementation of the per-connection protocol state machine
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lusta/router.hpp"
#include "lusta/utilities.hpp"

#include <algorithm>

namespace lusta {

using namespace lusta::utilities;

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING:    return "connecting";
        case SessionState::AUTHENTICATED: return "authenticated";
        case SessionState::ACTIVE:        return "active";
        case SessionState::CLOSED:        return "closed";
        default:                          return "unknown";
    }
}

RouterOptions RouterOptions::from_config(const ServerConfig& config) {
    RouterOptions options;
    options.policy = config.policy;
    options.rate_limit_per_second = config.rate_limit_per_second;
    options.rate_limit_burst = config.rate_limit_burst;
    return options;
}

Router::Router(
    PresenceRegistry& registry,
    MessageStore& store,
    AuthService& auth,
    QueryService& queries,
    RouterOptions options
)
    : registry_(registry)
    , store_(store)
    , auth_(auth)
    , queries_(queries)
    , options_(options)
{
    if (options_.rate_limit_per_second > 0.0) {
        rate_limiter_ = std::make_unique<RateLimiter>(
            options_.rate_limit_per_second,
            std::max(options_.rate_limit_burst, 1.0)
        );
    }
}

// ============================================================================
// Frame Dispatch
// ============================================================================

void Router::handle_frame(ConnectionContext& context, const std::string& raw) {
    if (context.state == SessionState::CLOSED) {
        return;
    }

    auto frame = InboundFrame::from_json(raw);
    if (!frame) {
        log_warn("Malformed frame on connection " + std::to_string(context.connection->id()));
        reply(context, frames::error(ErrorCode::PROTOCOL_ERROR, "malformed frame"));
        close_connection(context, CloseReason::PROTOCOL_ERROR);
        return;
    }

    if (context.state == SessionState::CONNECTING) {
        handle_handshake(context, *frame);
        return;
    }

    const Identity& identity = *context.identity;

    if (rate_limiter_ && !rate_limiter_->allow_frame(identity.id)) {
        log_warn("Rate limit exceeded for " + identity.username);
        reply(context, frames::error(ErrorCode::RATE_LIMITED, "too many requests"));
        return;
    }

    switch (frame->action) {
        case FrameAction::SEND_MESSAGE:
            handle_send_message(context, *frame);
            break;

        case FrameAction::GET_ONLINE_USERS:
            handle_get_online_users(context);
            break;

        case FrameAction::LIST_USERS:
            reply(context, queries_.list_users());
            break;

        case FrameAction::GET_CHATS:
            reply(context, queries_.chats_for(identity.id));
            break;

        case FrameAction::GET_MESSAGES:
            handle_get_messages(context, *frame);
            break;

        case FrameAction::LOGIN:
        case FrameAction::REGISTER:
            log_debug("Ignoring repeated handshake from " + identity.username);
            break;

        case FrameAction::UNKNOWN:
        default:
            log_debug("Ignoring unknown action '" + frame->action_name + "' from " + identity.username);
            break;
    }
}

// ============================================================================
// Handshake
// ============================================================================

void Router::handle_handshake(ConnectionContext& context, const InboundFrame& frame) {
    const bool is_login = frame.action == FrameAction::LOGIN;
    const bool is_register = frame.action == FrameAction::REGISTER;

    if ((!is_login && !is_register) || !frame.username || !frame.password) {
        log_warn("Connection " + std::to_string(context.connection->id()) +
                 " sent '" + frame.action_name + "' before authenticating");
        reply(context, frames::error(ErrorCode::AUTH_FAILURE, "authentication required"));
        close_connection(context, CloseReason::UNAUTHENTICATED);
        return;
    }

    AuthResult result = is_login
        ? auth_.verify(*frame.username, *frame.password)
        : auth_.register_user(*frame.username, *frame.password);

    if (!result.ok()) {
        std::string text;
        switch (result.error) {
            case ErrorCode::CONFLICT:            text = "username already exists"; break;
            case ErrorCode::INVALID_USERNAME:    text = "invalid username"; break;
            case ErrorCode::PERSISTENCE_FAILURE: text = "authentication unavailable"; break;
            default:                             text = "invalid credentials"; break;
        }
        log_info("Authentication failed for '" + *frame.username + "': " +
                 error_code_to_string(result.error));
        reply(context, frames::error(result.error, text));
        close_connection(context, CloseReason::UNAUTHENTICATED);
        return;
    }

    context.identity = *result.identity;
    context.state = SessionState::AUTHENTICATED;

    ConnectionPtr evicted = registry_.register_connection(*context.identity, context.connection);
    if (evicted) {
        log_info("User " + context.identity->username + " reconnected, closing connection " +
                 std::to_string(evicted->id()));
        evicted->close(CloseReason::REPLACED);
    }

    context.state = SessionState::ACTIVE;
    reply(context, frames::authenticated(*context.identity));

    log_info("User " + context.identity->username + " (ID: " +
             std::to_string(context.identity->id) + ") connected. Online: " +
             std::to_string(registry_.online_count()));
}

// ============================================================================
// Active Actions
// ============================================================================

void Router::handle_send_message(ConnectionContext& context, const InboundFrame& frame) {
    const Identity& sender = *context.identity;

    if (!frame.to) {
        reply(context, frames::error(ErrorCode::RECIPIENT_NOT_FOUND, "recipient not found"));
        return;
    }

    std::optional<Identity> recipient;
    try {
        recipient = auth_.lookup(*frame.to);
    } catch (const StoreError& e) {
        log_error("Recipient lookup failed: " + std::string(e.what()));
        reply(context, frames::error(ErrorCode::PERSISTENCE_FAILURE, "failed to resolve recipient"));
        return;
    }

    if (!recipient) {
        reply(context, frames::error(ErrorCode::RECIPIENT_NOT_FOUND, "recipient not found"));
        return;
    }

    if (!frame.message) {
        reply(context, frames::error(ErrorCode::INVALID_MESSAGE, "message must be a string"));
        return;
    }

    auto violation = check_policy(sender, *recipient, *frame.message);
    if (violation) {
        reply(context, frames::error(ErrorCode::INVALID_MESSAGE, *violation));
        return;
    }

    // created_at never goes backwards for one sender connection
    int64_t created_at = std::max(current_time_ms(), context.last_message_time);

    Message message;
    try {
        message = store_.insert_message(sender.id, recipient->id, *frame.message, created_at);
    } catch (const StoreError& e) {
        log_error("Failed to persist message from " + sender.username + ": " + e.what());
        reply(context, frames::error(ErrorCode::PERSISTENCE_FAILURE, "failed to store message"));
        return;
    }
    context.last_message_time = created_at;

    log_debug("Message " + std::to_string(message.id) + " " + sender.username +
              " -> " + recipient->username);

    ConnectionPtr target = registry_.lookup(recipient->id);
    if (target) {
        if (target->send_frame(frames::new_message(sender, message))) {
            try {
                if (store_.advance_delivery_state(message.id, DeliveryState::DELIVERED)) {
                    message.delivery_state = DeliveryState::DELIVERED;
                }
            } catch (const StoreError& e) {
                log_warn("Failed to record delivery of message " +
                         std::to_string(message.id) + ": " + e.what());
            }
        } else {
            log_warn("Push of message " + std::to_string(message.id) + " to " +
                     recipient->username + " failed (" +
                     error_code_to_string(ErrorCode::DELIVERY_PUSH_FAILURE) + ")");
        }
    }

    reply(context, frames::message_sent(recipient->username, message));
}

void Router::handle_get_online_users(ConnectionContext& context) {
    reply(context, frames::online_users(registry_.list_online()));
}

void Router::handle_get_messages(ConnectionContext& context, const InboundFrame& frame) {
    const Identity& identity = *context.identity;

    if (frame.partner_id) {
        reply(context, queries_.history(identity.id, *frame.partner_id));
    } else if (frame.with) {
        reply(context, queries_.history_with(identity.id, *frame.with));
    } else {
        reply(context, frames::error(ErrorCode::USER_NOT_FOUND, "partner_id or with is required"));
    }
}

std::optional<std::string> Router::check_policy(
    const Identity& sender,
    const Identity& recipient,
    const std::string& content
) const {
    const MessagePolicy& policy = options_.policy;

    if (!policy.allow_self_messages && sender.id == recipient.id) {
        return std::string("cannot message yourself");
    }
    if (!policy.allow_empty_content && content.empty()) {
        return std::string("message is empty");
    }
    if (policy.max_content_length > 0 && content.size() > policy.max_content_length) {
        return std::string("message too long");
    }
    return std::nullopt;
}

// ============================================================================
// Teardown
// ============================================================================

void Router::on_disconnect(ConnectionContext& context) {
    if (context.state == SessionState::CLOSED) {
        return;
    }
    release_presence(context);
    context.state = SessionState::CLOSED;
}

void Router::reply(ConnectionContext& context, const std::string& frame) {
    if (!context.connection->send_frame(frame)) {
        log_debug("Reply dropped on connection " + std::to_string(context.connection->id()));
    }
}

void Router::close_connection(ConnectionContext& context, CloseReason reason) {
    release_presence(context);
    context.state = SessionState::CLOSED;
    context.connection->close(reason);
}

void Router::release_presence(ConnectionContext& context) {
    if (!context.identity) {
        return;
    }
    if (context.state != SessionState::AUTHENTICATED && context.state != SessionState::ACTIVE) {
        return;
    }

    if (registry_.deregister(context.identity->id, context.connection)) {
        if (rate_limiter_) {
            rate_limiter_->forget(context.identity->id);
        }
        log_info("User " + context.identity->username + " disconnected. Online: " +
                 std::to_string(registry_.online_count()));
    } else {
        log_debug("Stale disconnect of " + context.identity->username + " ignored");
    }
}

} // namespace lusta
