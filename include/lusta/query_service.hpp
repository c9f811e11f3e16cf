/**
 * @file query_service.hpp
 * @brief Request/response surface over the user directory and history
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Transport-neutral: every call returns one serialized response frame,
 * either the requested document or an error frame.
 */

#pragma once

#include "lusta/chat_summary_aggregator.hpp"
#include "lusta/message_store.hpp"
#include "lusta/message_types.hpp"

#include <string>

namespace lusta {

/**
 * @brief QueryService - list users, list conversations, fetch history
 */
class QueryService {
public:
    QueryService(MessageStore& store, ChatSummaryAggregator& aggregator);

    /**
     * @brief All registered users
     * @return users frame
     */
    std::string list_users() const;

    /**
     * @brief Conversation summaries of a user
     * @return chats frame, or user_not_found error frame
     */
    std::string chats_for(UserId user_id) const;

    /**
     * @brief History between user and partner, marking the user's received messages read
     * @return messages frame, or user_not_found error frame
     */
    std::string history(UserId user_id, UserId partner_id);

    /**
     * @brief History with a partner given by display name
     */
    std::string history_with(UserId user_id, const std::string& partner_username);

private:
    MessageStore& store_;
    ChatSummaryAggregator& aggregator_;
};

} // namespace lusta
