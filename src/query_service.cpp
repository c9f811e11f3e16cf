/**
 * @file query_service.cpp
 * @brief Implementation of the query surface
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lusta/query_service.hpp"
#include "lusta/protocol.hpp"
#include "lusta/utilities.hpp"

namespace lusta {

using namespace lusta::utilities;

QueryService::QueryService(MessageStore& store, ChatSummaryAggregator& aggregator)
    : store_(store)
    , aggregator_(aggregator)
{
}

std::string QueryService::list_users() const {
    try {
        return frames::users(store_.list_users());
    } catch (const StoreError& e) {
        log_error("list_users failed: " + std::string(e.what()));
        return frames::error(ErrorCode::PERSISTENCE_FAILURE, "failed to load users");
    }
}

std::string QueryService::chats_for(UserId user_id) const {
    try {
        if (!store_.find_user_by_id(user_id)) {
            return frames::error(ErrorCode::USER_NOT_FOUND, "user not found");
        }
        return frames::chats(aggregator_.conversations_for(user_id));
    } catch (const StoreError& e) {
        log_error("chats_for failed: " + std::string(e.what()));
        return frames::error(ErrorCode::PERSISTENCE_FAILURE, "failed to load conversations");
    }
}

std::string QueryService::history(UserId user_id, UserId partner_id) {
    try {
        auto user = store_.find_user_by_id(user_id);
        auto partner = store_.find_user_by_id(partner_id);
        if (!user || !partner) {
            return frames::error(ErrorCode::USER_NOT_FOUND, "user not found");
        }

        auto messages = aggregator_.history(user_id, partner_id);
        return frames::messages(*user, *partner, messages);

    } catch (const StoreError& e) {
        log_error("history failed: " + std::string(e.what()));
        return frames::error(ErrorCode::PERSISTENCE_FAILURE, "failed to load history");
    }
}

std::string QueryService::history_with(UserId user_id, const std::string& partner_username) {
    try {
        auto partner = store_.find_user_by_name(partner_username);
        if (!partner) {
            return frames::error(ErrorCode::USER_NOT_FOUND, "user not found");
        }
        return history(user_id, partner->identity.id);

    } catch (const StoreError& e) {
        log_error("history failed: " + std::string(e.what()));
        return frames::error(ErrorCode::PERSISTENCE_FAILURE, "failed to load history");
    }
}

} // namespace lusta
