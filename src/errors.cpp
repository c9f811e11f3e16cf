/**
 * @file errors.cpp
 * @brief Error code names
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lusta/errors.hpp"

namespace lusta {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::AUTH_FAILURE: return "unauthenticated";
        case ErrorCode::CONFLICT: return "conflict";
        case ErrorCode::INVALID_USERNAME: return "invalid_username";
        case ErrorCode::RECIPIENT_NOT_FOUND: return "recipient_not_found";
        case ErrorCode::USER_NOT_FOUND: return "user_not_found";
        case ErrorCode::INVALID_MESSAGE: return "invalid_message";
        case ErrorCode::PROTOCOL_ERROR: return "protocol_error";
        case ErrorCode::DELIVERY_PUSH_FAILURE: return "delivery_push_failure";
        case ErrorCode::PERSISTENCE_FAILURE: return "persistence_failure";
        case ErrorCode::RATE_LIMITED: return "rate_limited";
        default: return "unknown";
    }
}

} // namespace lusta
