/**
 * @file sqlite_message_store.cpp
 * @brief Implementation of the SQLite-backed MessageStore
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lusta/sqlite_message_store.hpp"
#include "lusta/utilities.hpp"

#include <sqlite3.h>
#include <stdexcept>

namespace lusta {

using namespace lusta::utilities;

namespace {

    // Finalizes a prepared statement on every exit path
    class Statement {
    public:
        Statement(sqlite3* db, const char* sql)
            : db_(db)
            , stmt_(nullptr)
        {
            if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
                throw StoreError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
            }
        }

        ~Statement() {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
        }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        sqlite3_stmt* get() const { return stmt_; }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_;
    };

    std::string column_string(sqlite3_stmt* stmt, int column) {
        const unsigned char* text = sqlite3_column_text(stmt, column);
        if (!text) {
            return std::string();
        }
        // Length from SQLite, so embedded NUL bytes survive
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
    }

    Message read_message_row(sqlite3_stmt* stmt) {
        Message message;
        message.id = sqlite3_column_int64(stmt, 0);
        message.sender_id = sqlite3_column_int64(stmt, 1);
        message.receiver_id = sqlite3_column_int64(stmt, 2);
        message.content = column_string(stmt, 3);
        message.created_at = sqlite3_column_int64(stmt, 4);

        auto state = MessageHelpers::delivery_state_from_int(sqlite3_column_int(stmt, 5));
        message.delivery_state = state ? *state : DeliveryState::SENT;

        return message;
    }

    StoreError step_error(sqlite3* db, const std::string& context) {
        return StoreError(context + ": " + std::string(sqlite3_errmsg(db)));
    }

    const char* const MESSAGE_COLUMNS =
        "id, sender_id, receiver_id, content, created_at, delivery_state";

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

SqliteMessageStore::SqliteMessageStore(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    // Open SQLite database
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open message database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);
    sqlite3_busy_timeout(db, 5000);

    // Initialize database schema
    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize message database schema");
    }

    log_info("Message store opened: " + database_path_);
}

SqliteMessageStore::~SqliteMessageStore() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool SqliteMessageStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* pragmas = R"(
        PRAGMA foreign_keys = ON;
        PRAGMA journal_mode = WAL;
        PRAGMA synchronous = NORMAL;
    )";

    int rc = sqlite3_exec(db, pragmas, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        log_error("Message store pragma failed: " + std::string(error_msg ? error_msg : "unknown"));
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    const char* create_users_table = R"(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT NOT NULL UNIQUE,
            password_hash TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );
    )";

    rc = sqlite3_exec(db, create_users_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        log_error("Failed to create users table: " + std::string(error_msg ? error_msg : "unknown"));
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    const char* create_messages_table = R"(
        CREATE TABLE IF NOT EXISTS messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            sender_id INTEGER NOT NULL REFERENCES users(id),
            receiver_id INTEGER NOT NULL REFERENCES users(id),
            content TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            delivery_state INTEGER NOT NULL DEFAULT 0,
            CONSTRAINT valid_state CHECK (delivery_state >= 0 AND delivery_state <= 2)
        );
        CREATE INDEX IF NOT EXISTS idx_messages_pair
            ON messages(sender_id, receiver_id, created_at);
        CREATE INDEX IF NOT EXISTS idx_messages_inbox
            ON messages(receiver_id, sender_id, delivery_state);
    )";

    rc = sqlite3_exec(db, create_messages_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        log_error("Failed to create messages table: " + std::string(error_msg ? error_msg : "unknown"));
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// User Directory
// ============================================================================

std::optional<Identity> SqliteMessageStore::create_user(
    const std::string& username,
    const std::string& password_hash
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT INTO users (username, password_hash, created_at)
        VALUES (?, ?, ?)
    )";

    Statement stmt(db, sql);
    sqlite3_bind_text(stmt.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, password_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 3, current_time_ms());

    int rc = sqlite3_step(stmt.get());

    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        // UNIQUE(username) violated: the existing row is left untouched
        return std::nullopt;
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to create user");
    }

    Identity identity;
    identity.id = sqlite3_last_insert_rowid(db);
    identity.username = username;
    return identity;
}

std::optional<UserRecord> SqliteMessageStore::find_user_by_name(const std::string& username) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT id, username, password_hash, created_at
        FROM users
        WHERE username = ?
    )";

    Statement stmt(db, sql);
    sqlite3_bind_text(stmt.get(), 1, username.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        UserRecord record;
        record.identity.id = sqlite3_column_int64(stmt.get(), 0);
        record.identity.username = column_string(stmt.get(), 1);
        record.password_hash = column_string(stmt.get(), 2);
        record.created_at = sqlite3_column_int64(stmt.get(), 3);
        return record;
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to look up user");
    }

    return std::nullopt;
}

std::optional<Identity> SqliteMessageStore::find_user_by_id(UserId user_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    Statement stmt(db, "SELECT id, username FROM users WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, user_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        Identity identity;
        identity.id = sqlite3_column_int64(stmt.get(), 0);
        identity.username = column_string(stmt.get(), 1);
        return identity;
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to look up user");
    }

    return std::nullopt;
}

std::vector<Identity> SqliteMessageStore::list_users() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    std::vector<Identity> users;

    Statement stmt(db, "SELECT id, username FROM users ORDER BY id ASC");

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Identity identity;
        identity.id = sqlite3_column_int64(stmt.get(), 0);
        identity.username = column_string(stmt.get(), 1);
        users.push_back(std::move(identity));
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to list users");
    }

    return users;
}

// ============================================================================
// Messages
// ============================================================================

Message SqliteMessageStore::insert_message(
    UserId sender_id,
    UserId receiver_id,
    const std::string& content,
    int64_t created_at
) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT INTO messages (sender_id, receiver_id, content, created_at, delivery_state)
        VALUES (?, ?, ?, ?, 0)
    )";

    Statement stmt(db, sql);
    sqlite3_bind_int64(stmt.get(), 1, sender_id);
    sqlite3_bind_int64(stmt.get(), 2, receiver_id);
    sqlite3_bind_text(stmt.get(), 3, content.data(), static_cast<int>(content.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 4, created_at);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw step_error(db, "Failed to persist message");
    }

    Message message;
    message.id = sqlite3_last_insert_rowid(db);
    message.sender_id = sender_id;
    message.receiver_id = receiver_id;
    message.content = content;
    message.created_at = created_at;
    message.delivery_state = DeliveryState::SENT;
    return message;
}

std::optional<Message> SqliteMessageStore::find_message(MessageId message_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string("SELECT ") + MESSAGE_COLUMNS + " FROM messages WHERE id = ?";
    Statement stmt(db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, message_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return read_message_row(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to look up message");
    }

    return std::nullopt;
}

bool SqliteMessageStore::advance_delivery_state(MessageId message_id, DeliveryState target) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    // The guard on the current state makes regressions impossible
    const char* sql = R"(
        UPDATE messages
        SET delivery_state = ?1
        WHERE id = ?2 AND delivery_state < ?1
    )";

    Statement stmt(db, sql);
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(target));
    sqlite3_bind_int64(stmt.get(), 2, message_id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw step_error(db, "Failed to update delivery state");
    }

    return sqlite3_changes(db) > 0;
}

std::vector<UserId> SqliteMessageStore::conversation_partners(UserId user_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    std::vector<UserId> partners;

    // UNION removes duplicates across both directions
    const char* sql = R"(
        SELECT receiver_id FROM messages WHERE sender_id = ?1
        UNION
        SELECT sender_id FROM messages WHERE receiver_id = ?1
    )";

    Statement stmt(db, sql);
    sqlite3_bind_int64(stmt.get(), 1, user_id);

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        partners.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to enumerate conversation partners");
    }

    return partners;
}

std::optional<Message> SqliteMessageStore::last_message_between(UserId user_a, UserId user_b) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    std::string sql = std::string("SELECT ") + MESSAGE_COLUMNS + R"(
        FROM messages
        WHERE (sender_id = ?1 AND receiver_id = ?2)
           OR (sender_id = ?2 AND receiver_id = ?1)
        ORDER BY created_at DESC, id DESC
        LIMIT 1
    )";

    Statement stmt(db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, user_a);
    sqlite3_bind_int64(stmt.get(), 2, user_b);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return read_message_row(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to load last message");
    }

    return std::nullopt;
}

size_t SqliteMessageStore::count_unread(UserId receiver_id, UserId sender_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT COUNT(*) FROM messages
        WHERE receiver_id = ? AND sender_id = ? AND delivery_state < 2
    )";

    Statement stmt(db, sql);
    sqlite3_bind_int64(stmt.get(), 1, receiver_id);
    sqlite3_bind_int64(stmt.get(), 2, sender_id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw step_error(db, "Failed to count unread messages");
    }

    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<Message> SqliteMessageStore::conversation(UserId user_a, UserId user_b) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    std::vector<Message> messages;

    std::string sql = std::string("SELECT ") + MESSAGE_COLUMNS + R"(
        FROM messages
        WHERE (sender_id = ?1 AND receiver_id = ?2)
           OR (sender_id = ?2 AND receiver_id = ?1)
        ORDER BY created_at ASC, id ASC
    )";

    Statement stmt(db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, user_a);
    sqlite3_bind_int64(stmt.get(), 2, user_b);

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        messages.push_back(read_message_row(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw step_error(db, "Failed to load conversation");
    }

    return messages;
}

size_t SqliteMessageStore::mark_messages_read(const std::vector<MessageId>& message_ids) {
    if (message_ids.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    if (sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        throw step_error(db, "Failed to begin read-receipt transaction");
    }

    size_t changed = 0;

    try {
        Statement stmt(db, "UPDATE messages SET delivery_state = 2 WHERE id = ? AND delivery_state < 2");

        for (MessageId id : message_ids) {
            sqlite3_reset(stmt.get());
            sqlite3_bind_int64(stmt.get(), 1, id);

            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                throw step_error(db, "Failed to mark message read");
            }
            changed += static_cast<size_t>(sqlite3_changes(db));
        }
    } catch (const StoreError&) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }

    if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        StoreError error = step_error(db, "Failed to commit read receipts");
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw error;
    }

    return changed;
}

size_t SqliteMessageStore::message_count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    Statement stmt(db, "SELECT COUNT(*) FROM messages");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw step_error(db, "Failed to count messages");
    }

    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace lusta
