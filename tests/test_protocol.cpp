/**
 * @file test_protocol.cpp
 * @brief Unit tests for wire frame parsing and serialization
 *
 * Tests the frame layer including:
 * - Inbound frame parsing and malformed input
 * - Action name mapping
 * - Outbound frame shapes
 */

#include <gtest/gtest.h>
#include "lusta/protocol.hpp"
#include <nlohmann/json.hpp>

using namespace lusta;
using json = nlohmann::json;

// ============================================================================
// Inbound Frame Tests
// ============================================================================

TEST(ProtocolTest, ParseLoginFrame) {
    auto frame = InboundFrame::from_json(R"({"action":"login","username":"alice","password":"pw"})");

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->action, FrameAction::LOGIN);
    EXPECT_EQ(frame->action_name, "login");
    EXPECT_EQ(frame->username, "alice");
    EXPECT_EQ(frame->password, "pw");
    EXPECT_FALSE(frame->to.has_value());
}

TEST(ProtocolTest, ParseSendMessageFrame) {
    auto frame = InboundFrame::from_json(R"({"action":"send_message","to":"bob","message":"hi"})");

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->action, FrameAction::SEND_MESSAGE);
    EXPECT_EQ(frame->to, "bob");
    EXPECT_EQ(frame->message, "hi");
}

TEST(ProtocolTest, ParseGetMessagesFrame) {
    auto by_id = InboundFrame::from_json(R"({"action":"get_messages","partner_id":7})");
    ASSERT_TRUE(by_id.has_value());
    EXPECT_EQ(by_id->partner_id, 7);

    auto by_name = InboundFrame::from_json(R"({"action":"get_messages","with":"carol"})");
    ASSERT_TRUE(by_name.has_value());
    EXPECT_EQ(by_name->with, "carol");
    EXPECT_FALSE(by_name->partner_id.has_value());
}

TEST(ProtocolTest, WrongTypedFieldsLeftEmpty) {
    auto frame = InboundFrame::from_json(R"({"action":"send_message","to":5,"message":["x"]})");

    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame->to.has_value());
    EXPECT_FALSE(frame->message.has_value());
}

TEST(ProtocolTest, UnknownActionParses) {
    auto frame = InboundFrame::from_json(R"({"action":"typing","to":"bob"})");

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->action, FrameAction::UNKNOWN);
    EXPECT_EQ(frame->action_name, "typing");
}

TEST(ProtocolTest, MissingActionIsUnknown) {
    auto frame = InboundFrame::from_json(R"({"username":"alice"})");

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->action, FrameAction::UNKNOWN);
    EXPECT_EQ(frame->action_name, "");
}

TEST(ProtocolTest, MalformedFramesRejected) {
    EXPECT_FALSE(InboundFrame::from_json("").has_value());
    EXPECT_FALSE(InboundFrame::from_json("{not json").has_value());
    EXPECT_FALSE(InboundFrame::from_json("[1,2,3]").has_value());
    EXPECT_FALSE(InboundFrame::from_json("\"login\"").has_value());
    EXPECT_FALSE(InboundFrame::from_json("42").has_value());
}

TEST(ProtocolTest, ActionNamesRoundTrip) {
    for (auto action : {FrameAction::LOGIN, FrameAction::REGISTER, FrameAction::SEND_MESSAGE,
                        FrameAction::GET_ONLINE_USERS, FrameAction::LIST_USERS,
                        FrameAction::GET_CHATS, FrameAction::GET_MESSAGES}) {
        EXPECT_EQ(FrameHelpers::string_to_action(FrameHelpers::action_to_string(action)), action);
    }
}

// ============================================================================
// Outbound Frame Tests
// ============================================================================

TEST(ProtocolTest, NewMessageFrame) {
    Identity alice{1, "alice"};
    Message message;
    message.id = 12;
    message.sender_id = 1;
    message.receiver_id = 2;
    message.content = "hello";
    message.created_at = 1609459200123LL;

    json j = json::parse(frames::new_message(alice, message));
    EXPECT_EQ(j["type"], "new_message");
    EXPECT_EQ(j["from"], "alice");
    EXPECT_EQ(j["from_id"], 1);
    EXPECT_EQ(j["message"], "hello");
    EXPECT_EQ(j["message_id"], 12);
    EXPECT_EQ(j["timestamp"], "2021-01-01T00:00:00.123Z");
}

TEST(ProtocolTest, MessageSentFrame) {
    Message message;
    message.id = 3;
    message.created_at = 0;

    json j = json::parse(frames::message_sent("bob", message));
    EXPECT_EQ(j["type"], "message_sent");
    EXPECT_EQ(j["to"], "bob");
    EXPECT_EQ(j["message_id"], 3);
}

TEST(ProtocolTest, OnlineUsersFrame) {
    json j = json::parse(frames::online_users({{1, "alice"}, {2, "bob"}}));
    EXPECT_EQ(j["type"], "online_users");
    EXPECT_EQ(j["count"], 2);
    EXPECT_EQ(j["users"], json::array({"alice", "bob"}));
}

TEST(ProtocolTest, ErrorAndCloseFrames) {
    json error = json::parse(frames::error(ErrorCode::RECIPIENT_NOT_FOUND, "recipient not found"));
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["code"], "recipient_not_found");

    json close = json::parse(frames::close(CloseReason::REPLACED));
    EXPECT_EQ(close["type"], "close");
    EXPECT_EQ(close["reason"], "replaced");
}

TEST(ProtocolTest, MessagesFrameFlagsReadState) {
    Identity alice{1, "alice"};
    Identity bob{2, "bob"};

    Message first;
    first.id = 1;
    first.sender_id = 2;
    first.receiver_id = 1;
    first.content = "hi";
    first.delivery_state = DeliveryState::READ;

    Message second;
    second.id = 2;
    second.sender_id = 1;
    second.receiver_id = 2;
    second.content = "yo";
    second.delivery_state = DeliveryState::DELIVERED;

    json j = json::parse(frames::messages(alice, bob, {first, second}));
    EXPECT_EQ(j["type"], "messages");
    EXPECT_EQ(j["partner_id"], 2);
    ASSERT_EQ(j["messages"].size(), 2u);

    EXPECT_EQ(j["messages"][0]["sender_username"], "bob");
    EXPECT_EQ(j["messages"][0]["is_read"], true);
    EXPECT_EQ(j["messages"][0]["delivery_state"], "read");

    EXPECT_EQ(j["messages"][1]["sender_username"], "alice");
    EXPECT_EQ(j["messages"][1]["is_read"], false);
    EXPECT_EQ(j["messages"][1]["delivery_state"], "delivered");
}

TEST(ProtocolTest, InvalidUtf8IsReplaced) {
    Identity alice{1, "alice"};
    Message message;
    message.content = std::string("bad \xff byte");

    EXPECT_NO_THROW({
        json j = json::parse(frames::new_message(alice, message));
        EXPECT_TRUE(j["message"].is_string());
    });
}
