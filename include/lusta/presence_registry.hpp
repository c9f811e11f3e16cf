/**
 * @file presence_registry.hpp
 * @brief Registry of live connections per authenticated identity
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Single source of truth for who is online:
 * - At most one live connection per identity (last writer wins)
 * - Stale disconnects never evict a newer connection
 * - Every operation is linearizable (one mutex)
 */

#pragma once

#include "lusta/connection.hpp"
#include "lusta/message_types.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

namespace lusta {

/**
 * @brief Live registry entry
 */
struct PresenceEntry {
    Identity identity;
    ConnectionPtr connection;
};

/**
 * @brief PresenceRegistry - identity to connection handle mapping
 *
 * The registry never closes connections itself; callers close the
 * handle returned by register_connection.
 */
class PresenceRegistry {
public:
    PresenceRegistry() = default;

    // Disable copy and move
    PresenceRegistry(const PresenceRegistry&) = delete;
    PresenceRegistry& operator=(const PresenceRegistry&) = delete;
    PresenceRegistry(PresenceRegistry&&) = delete;
    PresenceRegistry& operator=(PresenceRegistry&&) = delete;

    /**
     * @brief Map identity to connection, replacing any prior entry
     * @param identity Authenticated identity
     * @param connection Live connection handle
     * @return Evicted connection handle (caller must close it), or nullptr
     */
    ConnectionPtr register_connection(const Identity& identity, ConnectionPtr connection);

    /**
     * @brief Remove identity's entry if it still maps to connection
     * @param identity_id Identity being disconnected
     * @param connection Handle that disconnected
     * @return true if the entry was removed, false if absent or already replaced
     */
    bool deregister(UserId identity_id, const ConnectionPtr& connection);

    /**
     * @brief Current connection for identity
     * @return Connection handle or nullptr if offline
     */
    ConnectionPtr lookup(UserId identity_id) const;

    /**
     * @brief Snapshot of online identities
     * @return Identities ordered by display name
     */
    std::vector<Identity> list_online() const;

    size_t online_count() const;

    /**
     * @brief Remove every entry and return the removed handles
     */
    std::vector<ConnectionPtr> clear();

private:
    /// Entries keyed by identity id
    std::map<UserId, PresenceEntry> entries_;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;
};

} // namespace lusta
