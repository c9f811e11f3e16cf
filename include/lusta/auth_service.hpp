/**
 * @file auth_service.hpp
 * @brief Account registration and credential verification
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "lusta/errors.hpp"
#include "lusta/message_store.hpp"
#include "lusta/message_types.hpp"
#include "lusta/password_hasher.hpp"

#include <optional>
#include <string>
#include <utility>

namespace lusta {

/**
 * @brief Outcome of an authentication request
 */
struct AuthResult {
    std::optional<Identity> identity;   ///< Set on success
    ErrorCode error = ErrorCode::NONE;  ///< Failure kind otherwise

    bool ok() const { return identity.has_value(); }

    static AuthResult success(Identity identity) {
        AuthResult result;
        result.identity = std::move(identity);
        return result;
    }

    static AuthResult failure(ErrorCode code) {
        AuthResult result;
        result.error = code;
        return result;
    }
};

/**
 * @brief AuthService - Credential checks over the user directory
 *
 * Display names are unique: a duplicate registration is rejected and
 * never overwrites the existing account.
 */
class AuthService {
public:
    AuthService(MessageStore& store, PasswordHasher hasher = PasswordHasher());

    /**
     * @brief Register a new account
     * @param display_name Unique display name
     * @param secret Password
     * @return Identity, or CONFLICT / INVALID_USERNAME / AUTH_FAILURE / PERSISTENCE_FAILURE
     */
    AuthResult register_user(const std::string& display_name, const std::string& secret);

    /**
     * @brief Verify credentials of an existing account
     * @param display_name Display name
     * @param secret Password
     * @return Identity, or AUTH_FAILURE (unknown name and wrong password are indistinguishable)
     */
    AuthResult verify(const std::string& display_name, const std::string& secret) const;

    /**
     * @brief Resolve a display name through the directory
     * @return Identity or std::nullopt if unknown
     * @throws StoreError on backing store failure
     */
    std::optional<Identity> lookup(const std::string& display_name) const;

private:
    MessageStore& store_;
    PasswordHasher hasher_;
};

} // namespace lusta
