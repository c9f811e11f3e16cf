/**
 * @file protocol.hpp
 * @brief Wire frames exchanged over a live LuStA connection
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Frames are single-line JSON objects:
 * - Inbound frames carry an "action" field
 * - Outbound frames carry a "type" field
 * - Timestamps are ISO 8601 UTC with milliseconds
 */

#pragma once

#include "lusta/connection.hpp"
#include "lusta/errors.hpp"
#include "lusta/message_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lusta {

/**
 * @brief Inbound actions understood by the router
 */
enum class FrameAction {
    LOGIN,              ///< Handshake with existing credentials
    REGISTER,           ///< Handshake creating a new account
    SEND_MESSAGE,       ///< Direct message to a display name
    GET_ONLINE_USERS,   ///< Presence snapshot
    LIST_USERS,         ///< User directory
    GET_CHATS,          ///< Conversation summaries of the caller
    GET_MESSAGES,       ///< History with one partner (marks received messages read)
    UNKNOWN             ///< Anything else, ignored for forward compatibility
};

/**
 * @brief Parsed inbound frame
 *
 * Fields absent from the frame, or present with the wrong JSON type,
 * are left empty; the router decides what that means per action.
 */
struct InboundFrame {
    FrameAction action = FrameAction::UNKNOWN;
    std::string action_name;                ///< Raw "action" value ("" if missing)

    std::optional<std::string> username;    ///< login / register
    std::optional<std::string> password;    ///< login / register
    std::optional<std::string> to;          ///< send_message recipient display name
    std::optional<std::string> message;     ///< send_message content
    std::optional<std::string> with;        ///< get_messages partner display name
    std::optional<UserId> partner_id;       ///< get_messages partner id

    /**
     * @brief Parse one frame
     * @param json JSON text
     * @return InboundFrame, or std::nullopt if the text is not a JSON object
     */
    static std::optional<InboundFrame> from_json(const std::string& json);
};

/**
 * @brief Helper functions for frame actions
 */
class FrameHelpers {
public:
    static std::string action_to_string(FrameAction action);
    static FrameAction string_to_action(const std::string& str);
};

namespace frames {

/// {type: "authenticated", user_id, username}
std::string authenticated(const Identity& identity);

/// {type: "new_message", from, from_id, message, timestamp, message_id}
std::string new_message(const Identity& sender, const Message& message);

/// {type: "message_sent", to, message_id, timestamp}
std::string message_sent(const std::string& to, const Message& message);

/// {type: "online_users", users, count}
std::string online_users(const std::vector<Identity>& users);

/// {type: "error", code, message}
std::string error(ErrorCode code, const std::string& message);

/// {type: "close", reason}
std::string close(CloseReason reason);

/// {type: "users", users: [{id, username}]}
std::string users(const std::vector<Identity>& users);

/// {type: "chats", chats: [{partner_id, partner_username, last_message, last_message_time, unread_count}]}
std::string chats(const std::vector<ConversationSummary>& summaries);

/**
 * @brief History frame for one conversation
 * @param requester Identity that fetched the history
 * @param partner Other side of the conversation
 * @param messages Messages ascending by creation time
 * @return {type: "messages", partner_id, messages: [...]}
 */
std::string messages(
    const Identity& requester,
    const Identity& partner,
    const std::vector<Message>& messages
);

} // namespace frames
} // namespace lusta
