/**
 * @file test_message_types.cpp
 * @brief Unit tests for message types and delivery state helpers
 *
 * Tests core value types including:
 * - Delivery state conversion
 * - Forward-only transition rule
 * - Identity equality
 * - Timestamp formatting
 */

#include <gtest/gtest.h>
#include "lusta/message_types.hpp"
#include "lusta/errors.hpp"
#include "lusta/utilities.hpp"

using namespace lusta;

// ============================================================================
// DeliveryState Conversion Tests
// ============================================================================

TEST(MessageTypesTest, DeliveryStateToString) {
    EXPECT_EQ(MessageHelpers::delivery_state_to_string(DeliveryState::SENT), "sent");
    EXPECT_EQ(MessageHelpers::delivery_state_to_string(DeliveryState::DELIVERED), "delivered");
    EXPECT_EQ(MessageHelpers::delivery_state_to_string(DeliveryState::READ), "read");
}

TEST(MessageTypesTest, StringToDeliveryState) {
    EXPECT_EQ(MessageHelpers::string_to_delivery_state("sent"), DeliveryState::SENT);
    EXPECT_EQ(MessageHelpers::string_to_delivery_state("delivered"), DeliveryState::DELIVERED);
    EXPECT_EQ(MessageHelpers::string_to_delivery_state("read"), DeliveryState::READ);
}

TEST(MessageTypesTest, StringToDeliveryStateInvalid) {
    EXPECT_FALSE(MessageHelpers::string_to_delivery_state("READ").has_value());
    EXPECT_FALSE(MessageHelpers::string_to_delivery_state("").has_value());
    EXPECT_FALSE(MessageHelpers::string_to_delivery_state("seen").has_value());
}

TEST(MessageTypesTest, DeliveryStateFromInt) {
    EXPECT_EQ(MessageHelpers::delivery_state_from_int(0), DeliveryState::SENT);
    EXPECT_EQ(MessageHelpers::delivery_state_from_int(1), DeliveryState::DELIVERED);
    EXPECT_EQ(MessageHelpers::delivery_state_from_int(2), DeliveryState::READ);
    EXPECT_FALSE(MessageHelpers::delivery_state_from_int(3).has_value());
    EXPECT_FALSE(MessageHelpers::delivery_state_from_int(-1).has_value());
}

// ============================================================================
// Transition Tests
// ============================================================================

TEST(MessageTypesTest, ForwardTransitions) {
    EXPECT_TRUE(MessageHelpers::is_forward_transition(DeliveryState::SENT, DeliveryState::DELIVERED));
    EXPECT_TRUE(MessageHelpers::is_forward_transition(DeliveryState::SENT, DeliveryState::READ));
    EXPECT_TRUE(MessageHelpers::is_forward_transition(DeliveryState::DELIVERED, DeliveryState::READ));
}

TEST(MessageTypesTest, BackwardAndSelfTransitionsRejected) {
    EXPECT_FALSE(MessageHelpers::is_forward_transition(DeliveryState::READ, DeliveryState::DELIVERED));
    EXPECT_FALSE(MessageHelpers::is_forward_transition(DeliveryState::READ, DeliveryState::SENT));
    EXPECT_FALSE(MessageHelpers::is_forward_transition(DeliveryState::DELIVERED, DeliveryState::SENT));
    EXPECT_FALSE(MessageHelpers::is_forward_transition(DeliveryState::READ, DeliveryState::READ));
}

TEST(MessageTypesTest, NewMessageDefaultsToSent) {
    Message message;
    EXPECT_EQ(message.delivery_state, DeliveryState::SENT);
    EXPECT_EQ(message.id, 0);
}

// ============================================================================
// Identity Tests
// ============================================================================

TEST(MessageTypesTest, IdentityEquality) {
    Identity a{1, "alice"};
    Identity b{1, "alice"};
    Identity c{2, "alice"};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

// ============================================================================
// Error Code and Timestamp Tests
// ============================================================================

TEST(MessageTypesTest, ErrorCodeWireNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::AUTH_FAILURE), "unauthenticated");
    EXPECT_EQ(error_code_to_string(ErrorCode::CONFLICT), "conflict");
    EXPECT_EQ(error_code_to_string(ErrorCode::RECIPIENT_NOT_FOUND), "recipient_not_found");
    EXPECT_EQ(error_code_to_string(ErrorCode::PROTOCOL_ERROR), "protocol_error");
    EXPECT_EQ(error_code_to_string(ErrorCode::PERSISTENCE_FAILURE), "persistence_failure");
    EXPECT_EQ(error_code_to_string(ErrorCode::RATE_LIMITED), "rate_limited");
}

TEST(MessageTypesTest, FormatTimestampEpoch) {
    EXPECT_EQ(utilities::format_timestamp_ms(0), "1970-01-01T00:00:00.000Z");
}

TEST(MessageTypesTest, FormatTimestampMilliseconds) {
    // 2021-01-01T00:00:00.123Z
    EXPECT_EQ(utilities::format_timestamp_ms(1609459200123LL), "2021-01-01T00:00:00.123Z");
}

TEST(MessageTypesTest, CurrentTimeIsRecent) {
    int64_t now = utilities::current_time_ms();
    EXPECT_GT(now, 1609459200000LL);
}
