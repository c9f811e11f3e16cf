/**
 * @file protocol.cpp
 * @brief Implementation of frame parsing and serialization
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lusta/protocol.hpp"
#include "lusta/utilities.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lusta {

namespace {

    std::string dump(const json& j) {
        // Replace invalid UTF-8 rather than throwing from inside a send path
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    std::optional<std::string> string_field(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }

} // namespace

// ============================================================================
// Action / Reason Conversion
// ============================================================================

std::string FrameHelpers::action_to_string(FrameAction action) {
    switch (action) {
        case FrameAction::LOGIN: return "login";
        case FrameAction::REGISTER: return "register";
        case FrameAction::SEND_MESSAGE: return "send_message";
        case FrameAction::GET_ONLINE_USERS: return "get_online_users";
        case FrameAction::LIST_USERS: return "list_users";
        case FrameAction::GET_CHATS: return "get_chats";
        case FrameAction::GET_MESSAGES: return "get_messages";
        default: return "unknown";
    }
}

FrameAction FrameHelpers::string_to_action(const std::string& str) {
    if (str == "login") return FrameAction::LOGIN;
    if (str == "register") return FrameAction::REGISTER;
    if (str == "send_message") return FrameAction::SEND_MESSAGE;
    if (str == "get_online_users") return FrameAction::GET_ONLINE_USERS;
    if (str == "list_users") return FrameAction::LIST_USERS;
    if (str == "get_chats") return FrameAction::GET_CHATS;
    if (str == "get_messages") return FrameAction::GET_MESSAGES;
    return FrameAction::UNKNOWN;
}

std::string close_reason_to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::NORMAL: return "normal";
        case CloseReason::UNAUTHENTICATED: return "unauthenticated";
        case CloseReason::PROTOCOL_ERROR: return "protocol_error";
        case CloseReason::REPLACED: return "replaced";
        case CloseReason::SHUTDOWN: return "shutdown";
        default: return "unknown";
    }
}

// ============================================================================
// Inbound Frames
// ============================================================================

std::optional<InboundFrame> InboundFrame::from_json(const std::string& json_str) {
    json j = json::parse(json_str, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    InboundFrame frame;

    auto action = string_field(j, "action");
    if (action) {
        frame.action_name = *action;
        frame.action = FrameHelpers::string_to_action(*action);
    }

    frame.username = string_field(j, "username");
    frame.password = string_field(j, "password");
    frame.to = string_field(j, "to");
    frame.message = string_field(j, "message");
    frame.with = string_field(j, "with");

    auto partner = j.find("partner_id");
    if (partner != j.end() && partner->is_number_integer()) {
        frame.partner_id = partner->get<UserId>();
    }

    return frame;
}

// ============================================================================
// Outbound Frames
// ============================================================================

namespace frames {

std::string authenticated(const Identity& identity) {
    json j;
    j["type"] = "authenticated";
    j["user_id"] = identity.id;
    j["username"] = identity.username;
    return dump(j);
}

std::string new_message(const Identity& sender, const Message& message) {
    json j;
    j["type"] = "new_message";
    j["from"] = sender.username;
    j["from_id"] = sender.id;
    j["message"] = message.content;
    j["timestamp"] = utilities::format_timestamp_ms(message.created_at);
    j["message_id"] = message.id;
    return dump(j);
}

std::string message_sent(const std::string& to, const Message& message) {
    json j;
    j["type"] = "message_sent";
    j["to"] = to;
    j["message_id"] = message.id;
    j["timestamp"] = utilities::format_timestamp_ms(message.created_at);
    return dump(j);
}

std::string online_users(const std::vector<Identity>& users) {
    json names = json::array();
    for (const auto& user : users) {
        names.push_back(user.username);
    }

    json j;
    j["type"] = "online_users";
    j["users"] = names;
    j["count"] = users.size();
    return dump(j);
}

std::string error(ErrorCode code, const std::string& message) {
    json j;
    j["type"] = "error";
    j["code"] = error_code_to_string(code);
    j["message"] = message;
    return dump(j);
}

std::string close(CloseReason reason) {
    json j;
    j["type"] = "close";
    j["reason"] = close_reason_to_string(reason);
    return dump(j);
}

std::string users(const std::vector<Identity>& users) {
    json list = json::array();
    for (const auto& user : users) {
        list.push_back({{"id", user.id}, {"username", user.username}});
    }

    json j;
    j["type"] = "users";
    j["users"] = list;
    return dump(j);
}

std::string chats(const std::vector<ConversationSummary>& summaries) {
    json list = json::array();
    for (const auto& summary : summaries) {
        json entry;
        entry["partner_id"] = summary.partner_id;
        entry["partner_username"] = summary.partner_username;
        entry["last_message"] = summary.last_message_text;
        entry["last_message_time"] = utilities::format_timestamp_ms(summary.last_message_time);
        entry["unread_count"] = summary.unread_count;
        list.push_back(entry);
    }

    json j;
    j["type"] = "chats";
    j["chats"] = list;
    return dump(j);
}

std::string messages(
    const Identity& requester,
    const Identity& partner,
    const std::vector<Message>& messages
) {
    json list = json::array();
    for (const auto& message : messages) {
        const Identity& sender = message.sender_id == requester.id ? requester : partner;

        json entry;
        entry["id"] = message.id;
        entry["sender_id"] = message.sender_id;
        entry["sender_username"] = sender.username;
        entry["receiver_id"] = message.receiver_id;
        entry["content"] = message.content;
        entry["timestamp"] = utilities::format_timestamp_ms(message.created_at);
        entry["is_read"] = message.delivery_state == DeliveryState::READ;
        entry["delivery_state"] = MessageHelpers::delivery_state_to_string(message.delivery_state);
        list.push_back(entry);
    }

    json j;
    j["type"] = "messages";
    j["partner_id"] = partner.id;
    j["messages"] = list;
    return dump(j);
}

} // namespace frames
} // namespace lusta
