/**
 * @file test_auth_service.cpp
 * @brief Unit tests for AuthService and PasswordHasher
 *
 * Tests authentication including:
 * - Password hashing and verification
 * - Registration and duplicate names
 * - Login failures
 * - Directory lookup
 */

#include <gtest/gtest.h>
#include "lusta/auth_service.hpp"
#include "lusta/sqlite_message_store.hpp"
#include <filesystem>
#include <memory>

using namespace lusta;
namespace fs = std::filesystem;

// Test fixture for authentication tests
class AuthServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(PasswordHasher::initialize());

        test_dir_ = fs::temp_directory_path() / "lusta_auth_test";
        fs::create_directories(test_dir_);

        store_ = std::make_unique<SqliteMessageStore>((test_dir_ / "auth.db").string());
        auth_ = std::make_unique<AuthService>(*store_, PasswordHasher(HashingParams::minimal()));
    }

    void TearDown() override {
        auth_.reset();
        store_.reset();

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
    std::unique_ptr<SqliteMessageStore> store_;
    std::unique_ptr<AuthService> auth_;
};

// ============================================================================
// Password Hasher Tests
// ============================================================================

TEST_F(AuthServiceTest, HashAndVerifyPassword) {
    PasswordHasher hasher(HashingParams::minimal());

    auto hash = hasher.hash_password("correct horse");
    ASSERT_TRUE(hash.has_value());
    EXPECT_NE(*hash, "correct horse");

    EXPECT_TRUE(hasher.verify_password("correct horse", *hash));
    EXPECT_FALSE(hasher.verify_password("wrong horse", *hash));
}

TEST_F(AuthServiceTest, HashesAreSalted) {
    PasswordHasher hasher(HashingParams::minimal());

    auto first = hasher.hash_password("same");
    auto second = hasher.hash_password("same");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
}

TEST_F(AuthServiceTest, VerifyRejectsGarbageHash) {
    PasswordHasher hasher(HashingParams::minimal());
    EXPECT_FALSE(hasher.verify_password("pw", "not-a-hash"));
}

// ============================================================================
// Registration Tests
// ============================================================================

TEST_F(AuthServiceTest, RegisterCreatesIdentity) {
    AuthResult result = auth_->register_user("alice", "secret");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::NONE);
    EXPECT_EQ(result.identity->username, "alice");
    EXPECT_GT(result.identity->id, 0);

    // Stored credential is a hash, not the secret
    auto record = store_->find_user_by_name("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_NE(record->password_hash, "secret");
}

TEST_F(AuthServiceTest, DuplicateRegistrationConflicts) {
    AuthResult first = auth_->register_user("alice", "secret");
    ASSERT_TRUE(first.ok());

    AuthResult second = auth_->register_user("alice", "different");
    EXPECT_FALSE(second.ok());
    EXPECT_EQ(second.error, ErrorCode::CONFLICT);

    // Original credentials still work, new ones do not
    EXPECT_TRUE(auth_->verify("alice", "secret").ok());
    EXPECT_FALSE(auth_->verify("alice", "different").ok());
}

TEST_F(AuthServiceTest, InvalidUsernameRejected) {
    EXPECT_EQ(auth_->register_user("", "secret").error, ErrorCode::INVALID_USERNAME);
    EXPECT_EQ(auth_->register_user("bad name", "secret").error, ErrorCode::INVALID_USERNAME);
    EXPECT_EQ(auth_->register_user(std::string(51, 'x'), "secret").error, ErrorCode::INVALID_USERNAME);
    EXPECT_TRUE(store_->list_users().empty());
}

TEST_F(AuthServiceTest, EmptyPasswordRejected) {
    AuthResult result = auth_->register_user("alice", "");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::AUTH_FAILURE);
}

// ============================================================================
// Login Tests
// ============================================================================

TEST_F(AuthServiceTest, VerifyReturnsSameIdentity) {
    AuthResult registered = auth_->register_user("bob", "pw");
    ASSERT_TRUE(registered.ok());

    AuthResult login = auth_->verify("bob", "pw");
    ASSERT_TRUE(login.ok());
    EXPECT_EQ(*login.identity, *registered.identity);
}

TEST_F(AuthServiceTest, WrongPasswordAndUnknownUserLookAlike) {
    ASSERT_TRUE(auth_->register_user("bob", "pw").ok());

    AuthResult wrong_password = auth_->verify("bob", "nope");
    AuthResult unknown_user = auth_->verify("nobody", "pw");

    EXPECT_EQ(wrong_password.error, ErrorCode::AUTH_FAILURE);
    EXPECT_EQ(unknown_user.error, ErrorCode::AUTH_FAILURE);
}

// ============================================================================
// Lookup Tests
// ============================================================================

TEST_F(AuthServiceTest, Lookup) {
    AuthResult registered = auth_->register_user("carol", "pw");
    ASSERT_TRUE(registered.ok());

    auto found = auth_->lookup("carol");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, *registered.identity);

    EXPECT_FALSE(auth_->lookup("dave").has_value());
}
