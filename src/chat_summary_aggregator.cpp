/**
 * @file chat_summary_aggregator.cpp
 * @brief Implementation of conversation list and history views
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lusta/chat_summary_aggregator.hpp"
#include "lusta/utilities.hpp"

#include <algorithm>

namespace lusta {

ChatSummaryAggregator::ChatSummaryAggregator(MessageStore& store)
    : store_(store)
{
}

std::vector<ConversationSummary> ChatSummaryAggregator::conversations_for(UserId identity_id) const {
    std::vector<ConversationSummary> summaries;

    for (UserId partner_id : store_.conversation_partners(identity_id)) {
        auto partner = store_.find_user_by_id(partner_id);
        if (!partner) {
            continue;
        }

        ConversationSummary summary;
        summary.partner_id = partner->id;
        summary.partner_username = partner->username;

        auto last = store_.last_message_between(identity_id, partner_id);
        if (last) {
            summary.last_message_text = last->content;
            summary.last_message_time = last->created_at;
        }

        summary.unread_count = store_.count_unread(identity_id, partner_id);
        summaries.push_back(std::move(summary));
    }

    std::sort(summaries.begin(), summaries.end(),
        [](const ConversationSummary& a, const ConversationSummary& b) {
            if (a.last_message_time != b.last_message_time) {
                return a.last_message_time > b.last_message_time;
            }
            return a.partner_id < b.partner_id;
        });

    return summaries;
}

std::vector<Message> ChatSummaryAggregator::history(UserId requester_id, UserId partner_id) {
    std::vector<Message> messages = store_.conversation(requester_id, partner_id);
    mark_received_messages_read(requester_id, messages);
    return messages;
}

size_t ChatSummaryAggregator::mark_received_messages_read(UserId reader_id, std::vector<Message>& messages) {
    std::vector<MessageId> unread;
    for (const auto& message : messages) {
        if (message.receiver_id == reader_id && message.delivery_state != DeliveryState::READ) {
            unread.push_back(message.id);
        }
    }

    if (unread.empty()) {
        return 0;
    }

    size_t changed = store_.mark_messages_read(unread);

    for (auto& message : messages) {
        if (message.receiver_id == reader_id) {
            message.delivery_state = DeliveryState::READ;
        }
    }

    utilities::log_debug("Marked " + std::to_string(changed) + " message(s) read for user " +
                         std::to_string(reader_id));
    return changed;
}

} // namespace lusta
