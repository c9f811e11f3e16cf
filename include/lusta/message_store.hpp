/**
 * @file message_store.hpp
 * @brief Durable store contract for users and messages
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Implementations must be thread-safe. Backing store failures are
 * raised as StoreError; lookups that match nothing return empty results.
 */

#pragma once

#include "lusta/errors.hpp"
#include "lusta/message_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lusta {

/**
 * @brief MessageStore - Durable CRUD and queries over users and messages
 */
class MessageStore {
public:
    virtual ~MessageStore() = default;

    // ========================================================================
    // User Directory
    // ========================================================================

    /**
     * @brief Create a user with a unique display name
     * @param username Display name
     * @param password_hash Encoded credential hash
     * @return New identity, or std::nullopt if the name is already taken
     * @throws StoreError on backing store failure
     */
    virtual std::optional<Identity> create_user(
        const std::string& username,
        const std::string& password_hash
    ) = 0;

    virtual std::optional<UserRecord> find_user_by_name(const std::string& username) const = 0;

    virtual std::optional<Identity> find_user_by_id(UserId user_id) const = 0;

    /**
     * @brief List all users ordered by id
     */
    virtual std::vector<Identity> list_users() const = 0;

    // ========================================================================
    // Messages
    // ========================================================================

    /**
     * @brief Persist a new message in state SENT
     * @return Stored message with its assigned id
     * @throws StoreError if the message could not be committed
     */
    virtual Message insert_message(
        UserId sender_id,
        UserId receiver_id,
        const std::string& content,
        int64_t created_at
    ) = 0;

    virtual std::optional<Message> find_message(MessageId message_id) const = 0;

    /**
     * @brief Atomically move a message forward to target state
     *
     * Never lowers the stored state.
     *
     * @return true if the stored state changed, false if it was already at or past target
     */
    virtual bool advance_delivery_state(MessageId message_id, DeliveryState target) = 0;

    /**
     * @brief Distinct users that sent to or received from user_id
     */
    virtual std::vector<UserId> conversation_partners(UserId user_id) const = 0;

    /**
     * @brief Most recent message between two users in either direction
     */
    virtual std::optional<Message> last_message_between(UserId user_a, UserId user_b) const = 0;

    /**
     * @brief Count messages from sender to receiver that are not READ
     */
    virtual size_t count_unread(UserId receiver_id, UserId sender_id) const = 0;

    /**
     * @brief All messages between two users, ascending by creation time
     */
    virtual std::vector<Message> conversation(UserId user_a, UserId user_b) const = 0;

    /**
     * @brief Advance the given messages to READ in one transaction
     * @return Number of messages whose state changed
     */
    virtual size_t mark_messages_read(const std::vector<MessageId>& message_ids) = 0;

    virtual size_t message_count() const = 0;
};

} // namespace lusta
