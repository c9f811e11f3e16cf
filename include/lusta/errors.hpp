/**
 * @file errors.hpp
 * @brief Error taxonomy for the LuStA routing core
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace lusta {

/**
 * @brief Failure kinds reported by the routing core
 *
 * The wire form of each code (error_code_to_string) is sent as the
 * "code" field of error frames.
 */
enum class ErrorCode {
    NONE,
    AUTH_FAILURE,            ///< Bad credentials, connection never reaches Active
    CONFLICT,                ///< Display name already registered
    INVALID_USERNAME,        ///< Display name fails validation
    RECIPIENT_NOT_FOUND,     ///< send_message to an unknown display name
    USER_NOT_FOUND,          ///< Query about an unknown user
    INVALID_MESSAGE,         ///< Content rejected by the message policy
    PROTOCOL_ERROR,          ///< Malformed frame, connection is closed
    DELIVERY_PUSH_FAILURE,   ///< Recipient online but push was not accepted
    PERSISTENCE_FAILURE,     ///< MessageStore could not commit
    RATE_LIMITED             ///< Frame dropped by the per-identity limiter
};

/**
 * @brief Convert error code to its wire string
 * @param code Error code
 * @return snake_case code (e.g., "recipient_not_found")
 */
std::string error_code_to_string(ErrorCode code);

/**
 * @brief Raised by MessageStore implementations when the backing store fails
 *
 * Lookups that simply find nothing return std::nullopt instead.
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what)
        : std::runtime_error(what)
    {}
};

} // namespace lusta
