/**
 * @file password_hasher.hpp
 * @brief Credential hashing for LuStA accounts
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Argon2id password hashing via libsodium crypto_pwhash_str.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <sodium.h>

namespace lusta {

/**
 * @brief Argon2id cost parameters
 */
struct HashingParams {
    unsigned long long opslimit;
    size_t memlimit;

    /// libsodium interactive limits (production default)
    static HashingParams interactive() {
        return HashingParams{crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
    }

    /// Lowest limits libsodium accepts (tests only)
    static HashingParams minimal() {
        return HashingParams{crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
    }
};

/**
 * @brief PasswordHasher - Hash and verify account secrets
 *
 * Thread-safe; holds only cost parameters.
 */
class PasswordHasher {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    explicit PasswordHasher(HashingParams params = HashingParams::interactive());

    /**
     * @brief Hash a password into a self-describing string
     * @param password Plain secret
     * @return Encoded hash, or std::nullopt if libsodium ran out of memory
     */
    std::optional<std::string> hash_password(const std::string& password) const;

    /**
     * @brief Verify a password against an encoded hash
     * @param password Plain secret
     * @param encoded_hash Output of hash_password
     * @return true if the password matches
     */
    bool verify_password(const std::string& password, const std::string& encoded_hash) const;

private:
    HashingParams params_;
};

} // namespace lusta
