/**
 * @file test_chat_server.cpp
 * @brief End-to-end tests for ChatServer over loopback TCP
 *
 * Tests the full stack including:
 * - Handshake and message exchange between live clients
 * - Oversized and unauthenticated frames
 * - Replacement of a connected identity
 * - Shutdown close frames
 */

#include <gtest/gtest.h>
#include "lusta/chat_server.hpp"
#include "lusta/sqlite_message_store.hpp"
#include <nlohmann/json.hpp>
#include <asio.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>

using namespace lusta;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Blocking line client
class TestClient {
public:
    explicit TestClient(uint16_t port)
        : socket_(io_context_)
    {
        socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void send(const json& frame) {
        send_raw(frame.dump() + "\n");
    }

    void send_raw(const std::string& data) {
        asio::write(socket_, asio::buffer(data));
    }

    json read_frame() {
        asio::read_until(socket_, buffer_, '\n');
        std::istream stream(&buffer_);
        std::string line;
        std::getline(stream, line);
        return json::parse(line);
    }

    // Read frames until one of the given type arrives
    json read_until_type(const std::string& type) {
        for (;;) {
            json frame = read_frame();
            if (frame.value("type", "") == type) {
                return frame;
            }
        }
    }

    bool at_eof() {
        asio::error_code error;
        asio::read_until(socket_, buffer_, '\n', error);
        return error == asio::error::eof || error == asio::error::connection_reset;
    }

private:
    asio::io_context io_context_;
    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
};

json handshake(const std::string& action, const std::string& user, const std::string& password) {
    return json{{"action", action}, {"username", user}, {"password", password}};
}

} // namespace

// Test fixture for end-to-end server tests
class ChatServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(PasswordHasher::initialize());

        test_dir_ = fs::temp_directory_path() / "lusta_server_test";
        fs::create_directories(test_dir_);

        store_ = std::make_unique<SqliteMessageStore>((test_dir_ / "server.db").string());

        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.worker_threads = 2;
        config.max_frame_size = 1024;

        server_ = std::make_unique<ChatServer>(config, *store_, PasswordHasher(HashingParams::minimal()));
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        server_.reset();
        store_.reset();

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    std::unique_ptr<TestClient> connect_as(const std::string& action, const std::string& user) {
        auto client = std::make_unique<TestClient>(server_->port());
        client->send(handshake(action, user, "pw-" + user));
        json frame = client->read_frame();
        EXPECT_EQ(frame["type"], "authenticated");
        return client;
    }

    fs::path test_dir_;
    std::unique_ptr<SqliteMessageStore> store_;
    std::unique_ptr<ChatServer> server_;
};

// ============================================================================
// Message Exchange Tests
// ============================================================================

TEST_F(ChatServerTest, RegisterAndExchangeMessages) {
    auto alice = connect_as("register", "alice");
    auto bob = connect_as("register", "bob");

    alice->send({{"action", "send_message"}, {"to", "bob"}, {"message", "hello bob"}});

    json ack = alice->read_until_type("message_sent");
    EXPECT_EQ(ack["to"], "bob");

    json pushed = bob->read_until_type("new_message");
    EXPECT_EQ(pushed["from"], "alice");
    EXPECT_EQ(pushed["message"], "hello bob");
    EXPECT_EQ(pushed["message_id"], ack["message_id"]);

    auto stored = store_->find_message(ack["message_id"].get<MessageId>());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->delivery_state, DeliveryState::DELIVERED);
}

TEST_F(ChatServerTest, OnlineUsersAndHistory) {
    auto alice = connect_as("register", "alice");
    auto bob = connect_as("register", "bob");

    alice->send({{"action", "get_online_users"}});
    json online = alice->read_until_type("online_users");
    EXPECT_EQ(online["count"], 2);

    alice->send({{"action", "send_message"}, {"to", "bob"}, {"message", "one"}});
    alice->read_until_type("message_sent");

    bob->send({{"action", "get_messages"}, {"with", "alice"}});
    json history = bob->read_until_type("messages");
    ASSERT_EQ(history["messages"].size(), 1u);
    EXPECT_EQ(history["messages"][0]["is_read"], true);
}

TEST_F(ChatServerTest, LoginAfterReconnect) {
    {
        auto alice = connect_as("register", "alice");
    }

    // Old socket is gone; logging in again works with the same identity
    auto again = std::make_unique<TestClient>(server_->port());
    again->send(handshake("login", "alice", "pw-alice"));
    json frame = again->read_frame();
    EXPECT_EQ(frame["type"], "authenticated");
    EXPECT_EQ(frame["username"], "alice");
}

// ============================================================================
// Rejection Tests
// ============================================================================

TEST_F(ChatServerTest, UnauthenticatedFirstFrameCloses) {
    TestClient client(server_->port());
    client.send({{"action", "get_online_users"}});

    json error = client.read_frame();
    EXPECT_EQ(error["type"], "error");
    EXPECT_EQ(error["code"], "unauthenticated");

    json close = client.read_frame();
    EXPECT_EQ(close["type"], "close");
    EXPECT_EQ(close["reason"], "unauthenticated");

    EXPECT_TRUE(client.at_eof());
}

TEST_F(ChatServerTest, OversizedFrameClosesWithProtocolError) {
    auto alice = connect_as("register", "alice");

    alice->send_raw(std::string(4096, 'x') + "\n");

    json error = alice->read_until_type("error");
    EXPECT_EQ(error["code"], "protocol_error");

    json close = alice->read_until_type("close");
    EXPECT_EQ(close["reason"], "protocol_error");
}

TEST_F(ChatServerTest, MalformedJsonClosesWithProtocolError) {
    auto alice = connect_as("register", "alice");

    alice->send_raw("{oops\n");

    json close = alice->read_until_type("close");
    EXPECT_EQ(close["reason"], "protocol_error");
}

// ============================================================================
// Replacement and Shutdown Tests
// ============================================================================

TEST_F(ChatServerTest, SecondLoginReplacesFirst) {
    auto first = connect_as("register", "alice");

    auto second = std::make_unique<TestClient>(server_->port());
    second->send(handshake("login", "alice", "pw-alice"));
    EXPECT_EQ(second->read_frame()["type"], "authenticated");

    json close = first->read_until_type("close");
    EXPECT_EQ(close["reason"], "replaced");

    // The replacement still receives messages
    auto bob = connect_as("register", "bob");
    bob->send({{"action", "send_message"}, {"to", "alice"}, {"message", "still there?"}});
    json pushed = second->read_until_type("new_message");
    EXPECT_EQ(pushed["message"], "still there?");
}

TEST_F(ChatServerTest, StopSendsShutdown) {
    auto alice = connect_as("register", "alice");

    std::thread stopper([this]() {
        server_->stop();
    });

    json close = alice->read_until_type("close");
    EXPECT_EQ(close["reason"], "shutdown");

    stopper.join();
    EXPECT_FALSE(server_->is_running());
    EXPECT_EQ(server_->registry().online_count(), 0u);
}

TEST_F(ChatServerTest, RunReturnsAfterStop) {
    for (int i = 0; i < 20; ++i) {
        if (i > 0) {
            ASSERT_TRUE(server_->start());
        }

        std::thread runner([this]() {
            server_->run();
        });
        server_->stop();
        runner.join();

        EXPECT_FALSE(server_->is_running());
    }
}

// ============================================================================
// Session Teardown Tests
// ============================================================================

TEST(ConnectionSessionTest, AbortReleasesHandlersWithoutRunningContext) {
    asio::io_context io_context;
    asio::ip::tcp::acceptor acceptor(io_context,
        asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));

    asio::ip::tcp::socket client(io_context);
    client.connect(acceptor.local_endpoint());
    asio::ip::tcp::socket accepted = acceptor.accept();

    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> watch = token;
    int close_calls = 0;

    auto session = std::make_shared<ConnectionSession>(1, std::move(accepted), 1024, 8);
    session->start(
        [token](const std::string&) {},
        [token, &close_calls]() { ++close_calls; }
    );
    token.reset();

    // Linger never runs: the context is not being run
    session->close(CloseReason::SHUTDOWN);
    EXPECT_FALSE(watch.expired());

    session->abort();
    EXPECT_TRUE(watch.expired());
    EXPECT_EQ(close_calls, 1);
    EXPECT_FALSE(session->is_open());
    EXPECT_FALSE(session->send_frame("{}"));

    // Second teardown is a no-op
    session->abort();
    EXPECT_EQ(close_calls, 1);
}
