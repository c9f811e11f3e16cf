/**
 * @file presence_registry.cpp
 * @brief Implementation of the presence registry
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lusta/presence_registry.hpp"

#include <algorithm>
#include <utility>

namespace lusta {

ConnectionPtr PresenceRegistry::register_connection(const Identity& identity, ConnectionPtr connection) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(identity.id);
    if (it == entries_.end()) {
        entries_.emplace(identity.id, PresenceEntry{identity, std::move(connection)});
        return nullptr;
    }

    // Same handle registered twice is not an eviction
    if (it->second.connection == connection) {
        it->second.identity = identity;
        return nullptr;
    }

    ConnectionPtr evicted = std::move(it->second.connection);
    it->second.identity = identity;
    it->second.connection = std::move(connection);
    return evicted;
}

bool PresenceRegistry::deregister(UserId identity_id, const ConnectionPtr& connection) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(identity_id);
    if (it == entries_.end() || it->second.connection != connection) {
        return false;
    }

    entries_.erase(it);
    return true;
}

ConnectionPtr PresenceRegistry::lookup(UserId identity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(identity_id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.connection;
}

std::vector<Identity> PresenceRegistry::list_online() const {
    std::vector<Identity> online;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        online.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            online.push_back(entry.identity);
        }
    }

    std::sort(online.begin(), online.end(), [](const Identity& a, const Identity& b) {
        return a.username < b.username;
    });

    return online;
}

size_t PresenceRegistry::online_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<ConnectionPtr> PresenceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ConnectionPtr> removed;
    removed.reserve(entries_.size());
    for (auto& [id, entry] : entries_) {
        removed.push_back(std::move(entry.connection));
    }
    entries_.clear();

    return removed;
}

} // namespace lusta
