/**
 * @file chat_summary_aggregator.hpp
 * @brief Conversation list and history views derived from the MessageStore
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "lusta/message_store.hpp"
#include "lusta/message_types.hpp"

#include <vector>

namespace lusta {

/**
 * @brief ChatSummaryAggregator - derived conversation views
 *
 * Stateless; every call queries the store. conversations_for is
 * read-only, history advances received messages to READ.
 */
class ChatSummaryAggregator {
public:
    explicit ChatSummaryAggregator(MessageStore& store);

    /**
     * @brief Conversation summaries for an identity
     *
     * One entry per distinct partner, ordered by last_message_time
     * descending, ties broken by partner id ascending.
     *
     * @param identity_id Identity whose conversations are listed
     * @return Summaries with last message and unread count per partner
     * @throws StoreError on backing store failure
     */
    std::vector<ConversationSummary> conversations_for(UserId identity_id) const;

    /**
     * @brief Conversation between requester and partner, ascending by time
     *
     * Marks every returned message received by requester as READ (see
     * mark_received_messages_read). Messages the requester sent are never
     * touched.
     *
     * @param requester_id Identity fetching the history
     * @param partner_id Other side of the conversation
     * @return Messages with their delivery state after the read side effect
     * @throws StoreError on backing store failure
     */
    std::vector<Message> history(UserId requester_id, UserId partner_id);

    /**
     * @brief Advance messages received by reader to READ
     * @param reader_id Identity that consumed the messages
     * @param messages Messages to inspect; updated in place
     * @return Number of messages newly marked READ
     * @throws StoreError on backing store failure
     */
    size_t mark_received_messages_read(UserId reader_id, std::vector<Message>& messages);

private:
    MessageStore& store_;
};

} // namespace lusta
