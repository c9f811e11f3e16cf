/**
 * @file password_hasher.cpp
 * @brief Implementation of credential hashing
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Argon2id: memory-hard password hashing
 * - libsodium: Industry-standard implementation
 */

#include "lusta/password_hasher.hpp"

#include <array>

namespace lusta {

bool PasswordHasher::initialize() {
    // Initialize libsodium (safe to call multiple times)
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

PasswordHasher::PasswordHasher(HashingParams params)
    : params_(params)
{
}

std::optional<std::string> PasswordHasher::hash_password(const std::string& password) const {
    std::array<char, crypto_pwhash_STRBYTES> encoded{};

    int rc = crypto_pwhash_str(
        encoded.data(),
        password.data(),
        password.size(),
        params_.opslimit,
        params_.memlimit
    );

    if (rc != 0) {
        return std::nullopt;
    }

    return std::string(encoded.data());
}

bool PasswordHasher::verify_password(const std::string& password, const std::string& encoded_hash) const {
    // crypto_pwhash_str_verify expects a NUL-terminated buffer
    if (encoded_hash.empty() || encoded_hash.size() >= crypto_pwhash_STRBYTES) {
        return false;
    }

    return crypto_pwhash_str_verify(
        encoded_hash.c_str(),
        password.data(),
        password.size()
    ) == 0;
}

} // namespace lusta
