/**
 * @file message_types.hpp
 * @brief Domain records for LuStA direct messaging
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Records shared by the store, the router and the aggregator:
 * - Identity (stable id + unique display name)
 * - Message with its monotonic delivery state
 * - Derived conversation summary
 */

#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace lusta {

/// Stable user identifier, assigned once at registration
using UserId = int64_t;

/// Persisted message identifier
using MessageId = int64_t;

/**
 * @brief Delivery lifecycle of a message
 *
 * Ordinal values are persisted and only ever move forward:
 * SENT -> DELIVERED -> READ.
 */
enum class DeliveryState {
    SENT = 0,         ///< Persisted, not yet pushed to the recipient
    DELIVERED = 1,    ///< Recipient's live connection accepted the push
    READ = 2          ///< Recipient fetched the conversation history
};

/**
 * @brief Authenticated user reference
 */
struct Identity {
    UserId id = 0;              ///< Immutable identifier
    std::string username;       ///< Unique display name

    bool operator==(const Identity& other) const {
        return id == other.id && username == other.username;
    }
    bool operator!=(const Identity& other) const { return !(*this == other); }
};

/**
 * @brief User directory row, including credential material
 */
struct UserRecord {
    Identity identity;
    std::string password_hash;  ///< libsodium crypto_pwhash_str output
    int64_t created_at = 0;     ///< Milliseconds since epoch
};

/**
 * @brief Direct message between two identities
 *
 * Immutable except for delivery_state.
 */
struct Message {
    MessageId id = 0;
    UserId sender_id = 0;
    UserId receiver_id = 0;
    std::string content;
    int64_t created_at = 0;     ///< Milliseconds since epoch
    DeliveryState delivery_state = DeliveryState::SENT;
};

/**
 * @brief One row of a user's conversation list
 */
struct ConversationSummary {
    UserId partner_id = 0;
    std::string partner_username;
    std::string last_message_text;
    int64_t last_message_time = 0;  ///< Milliseconds since epoch
    size_t unread_count = 0;
};

/**
 * @brief Helper functions for delivery states
 */
class MessageHelpers {
public:
    /**
     * @brief Convert delivery state to string
     * @param state Delivery state
     * @return Lowercase name ("sent", "delivered", "read")
     */
    static std::string delivery_state_to_string(DeliveryState state);

    /**
     * @brief Convert string to delivery state
     * @param str Lowercase name
     * @return DeliveryState or std::nullopt if invalid
     */
    static std::optional<DeliveryState> string_to_delivery_state(const std::string& str);

    /**
     * @brief Convert persisted ordinal to delivery state
     * @param value Stored integer
     * @return DeliveryState or std::nullopt if out of range
     */
    static std::optional<DeliveryState> delivery_state_from_int(int value);

    /**
     * @brief Check that moving from one state to another never regresses
     * @return true if target is strictly later in the lifecycle
     */
    static bool is_forward_transition(DeliveryState from, DeliveryState to);
};

} // namespace lusta
