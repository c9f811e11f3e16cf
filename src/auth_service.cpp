/**
 * @file auth_service.cpp
 * @brief Implementation of account registration and verification
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lusta/auth_service.hpp"
#include "lusta/server_config.hpp"
#include "lusta/utilities.hpp"

namespace lusta {

using namespace lusta::utilities;

AuthService::AuthService(MessageStore& store, PasswordHasher hasher)
    : store_(store)
    , hasher_(std::move(hasher))
{
}

AuthResult AuthService::register_user(const std::string& display_name, const std::string& secret) {
    if (!config::validate_username(display_name)) {
        log_warn("Registration rejected, invalid username");
        return AuthResult::failure(ErrorCode::INVALID_USERNAME);
    }

    if (secret.size() < limits::MIN_PASSWORD_LENGTH) {
        log_warn("Registration rejected for " + display_name + ": empty password");
        return AuthResult::failure(ErrorCode::AUTH_FAILURE);
    }

    try {
        // Skips hashing for taken names; create_user still rejects racing duplicates
        if (store_.find_user_by_name(display_name)) {
            log_warn("Registration rejected, username taken: " + display_name);
            return AuthResult::failure(ErrorCode::CONFLICT);
        }

        auto hash = hasher_.hash_password(secret);
        if (!hash) {
            log_error("Password hashing failed for " + display_name);
            return AuthResult::failure(ErrorCode::PERSISTENCE_FAILURE);
        }

        auto identity = store_.create_user(display_name, *hash);
        if (!identity) {
            log_warn("Registration rejected, username taken: " + display_name);
            return AuthResult::failure(ErrorCode::CONFLICT);
        }

        log_info("Registered user " + identity->username + " (ID: " + std::to_string(identity->id) + ")");
        return AuthResult::success(*identity);

    } catch (const StoreError& e) {
        log_error("Registration failed for " + display_name + ": " + e.what());
        return AuthResult::failure(ErrorCode::PERSISTENCE_FAILURE);
    }
}

AuthResult AuthService::verify(const std::string& display_name, const std::string& secret) const {
    try {
        auto record = store_.find_user_by_name(display_name);
        if (!record || !hasher_.verify_password(secret, record->password_hash)) {
            log_warn("Authentication failed for " + display_name);
            return AuthResult::failure(ErrorCode::AUTH_FAILURE);
        }

        return AuthResult::success(record->identity);

    } catch (const StoreError& e) {
        log_error("Authentication lookup failed for " + display_name + ": " + e.what());
        return AuthResult::failure(ErrorCode::PERSISTENCE_FAILURE);
    }
}

std::optional<Identity> AuthService::lookup(const std::string& display_name) const {
    auto record = store_.find_user_by_name(display_name);
    if (!record) {
        return std::nullopt;
    }
    return record->identity;
}

} // namespace lusta
