/**
 * @file message_types.cpp
 * @brief Implementation of delivery state helpers
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lusta/message_types.hpp"

namespace lusta {

std::string MessageHelpers::delivery_state_to_string(DeliveryState state) {
    switch (state) {
        case DeliveryState::SENT: return "sent";
        case DeliveryState::DELIVERED: return "delivered";
        case DeliveryState::READ: return "read";
        default: return "unknown";
    }
}

std::optional<DeliveryState> MessageHelpers::string_to_delivery_state(const std::string& str) {
    if (str == "sent") return DeliveryState::SENT;
    if (str == "delivered") return DeliveryState::DELIVERED;
    if (str == "read") return DeliveryState::READ;
    return std::nullopt;
}

std::optional<DeliveryState> MessageHelpers::delivery_state_from_int(int value) {
    switch (value) {
        case 0: return DeliveryState::SENT;
        case 1: return DeliveryState::DELIVERED;
        case 2: return DeliveryState::READ;
        default: return std::nullopt;
    }
}

bool MessageHelpers::is_forward_transition(DeliveryState from, DeliveryState to) {
    return static_cast<int>(to) > static_cast<int>(from);
}

} // namespace lusta
