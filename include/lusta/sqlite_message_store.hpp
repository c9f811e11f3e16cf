/**
 * @file sqlite_message_store.hpp
 * @brief SQLite-backed MessageStore
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Durable user directory and message history:
 * - SQLite persistence (WAL journal for file databases)
 * - Unique display names enforced by the schema
 * - Conditional updates keep delivery state monotonic
 * - Thread-safe operations
 */

#pragma once

#include "lusta/message_store.hpp"

#include <mutex>
#include <string>

namespace lusta {

/**
 * @brief SqliteMessageStore - MessageStore over a single SQLite connection
 *
 * Thread-safe for concurrent access; all statements are serialized on
 * one connection.
 */
class SqliteMessageStore : public MessageStore {
public:
    /**
     * @brief Open (or create) the database and its schema
     * @param database_path Path to SQLite database file (":memory:" for a private in-memory db)
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit SqliteMessageStore(const std::string& database_path);

    /**
     * @brief Destructor - closes database
     */
    ~SqliteMessageStore() override;

    // Disable copy and move
    SqliteMessageStore(const SqliteMessageStore&) = delete;
    SqliteMessageStore& operator=(const SqliteMessageStore&) = delete;
    SqliteMessageStore(SqliteMessageStore&&) = delete;
    SqliteMessageStore& operator=(SqliteMessageStore&&) = delete;

    std::optional<Identity> create_user(
        const std::string& username,
        const std::string& password_hash
    ) override;
    std::optional<UserRecord> find_user_by_name(const std::string& username) const override;
    std::optional<Identity> find_user_by_id(UserId user_id) const override;
    std::vector<Identity> list_users() const override;

    Message insert_message(
        UserId sender_id,
        UserId receiver_id,
        const std::string& content,
        int64_t created_at
    ) override;
    std::optional<Message> find_message(MessageId message_id) const override;
    bool advance_delivery_state(MessageId message_id, DeliveryState target) override;
    std::vector<UserId> conversation_partners(UserId user_id) const override;
    std::optional<Message> last_message_between(UserId user_a, UserId user_b) const override;
    size_t count_unread(UserId receiver_id, UserId sender_id) const override;
    std::vector<Message> conversation(UserId user_a, UserId user_b) const override;
    size_t mark_messages_read(const std::vector<MessageId>& message_ids) override;
    size_t message_count() const override;

    /**
     * @brief Path this store was opened with
     */
    const std::string& database_path() const { return database_path_; }

private:
    /// Path to SQLite database
    std::string database_path_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    /**
     * @brief Initialize database schema
     * @return true if successful, false otherwise
     */
    bool initialize_database();
};

} // namespace lusta
