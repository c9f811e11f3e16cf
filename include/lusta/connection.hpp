/**
 * @file connection.hpp
 * @brief Live duplex connection handle
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace lusta {

/**
 * @brief Why a connection was closed by the server
 */
enum class CloseReason {
    NORMAL,             ///< Peer closed or server closed without error
    UNAUTHENTICATED,    ///< Handshake failed, never reached Active
    PROTOCOL_ERROR,     ///< Malformed or oversized frame
    REPLACED,           ///< Same identity connected again elsewhere
    SHUTDOWN            ///< Server is stopping
};

/**
 * @brief Convert close reason to its wire string
 */
std::string close_reason_to_string(CloseReason reason);

/// Server-assigned connection number, unique per process
using ConnectionId = uint64_t;

/**
 * @brief Connection - handle to one live channel bound to at most one identity
 *
 * send_frame never blocks: frames are queued (bounded) and written
 * asynchronously. close is idempotent; only the first call has effect.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual ConnectionId id() const = 0;

    /**
     * @brief Queue one frame for delivery
     * @param frame Serialized frame (without delimiter)
     * @return true if the frame was accepted, false if closing or the queue is full
     */
    virtual bool send_frame(const std::string& frame) = 0;

    /**
     * @brief Close the connection, flushing queued frames first
     * @param reason Reason reported to the peer in the final close frame
     */
    virtual void close(CloseReason reason) = 0;

    virtual bool is_open() const = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace lusta
