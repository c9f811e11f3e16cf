/**
 * @file connection_session.hpp
 * @brief TCP transport for one client connection
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Frames are newline-delimited JSON. Each session:
 * - Reads one frame at a time and hands it to the frame handler
 * - Writes queued frames in order on its strand
 * - Bounds both the inbound frame size and the outbound queue
 * - Sends a final close frame and lingers briefly before closing the socket
 */

#pragma once

#include "lusta/connection.hpp"

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lusta {

/**
 * @brief ConnectionSession - Asio socket implementing Connection
 *
 * All socket work runs on the session's strand. send_frame and close
 * may be called from any thread.
 */
class ConnectionSession : public Connection,
                          public std::enable_shared_from_this<ConnectionSession> {
public:
    using FrameHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void()>;

    /**
     * @param id Server-assigned connection number
     * @param socket Accepted socket
     * @param max_frame_size Largest inbound frame accepted (excluding delimiter)
     * @param queue_limit Outbound frames that may be pending before send_frame fails
     */
    ConnectionSession(
        ConnectionId id,
        asio::ip::tcp::socket socket,
        size_t max_frame_size,
        size_t queue_limit
    );

    // Disable copy and move
    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;
    ConnectionSession(ConnectionSession&&) = delete;
    ConnectionSession& operator=(ConnectionSession&&) = delete;

    /**
     * @brief Begin reading frames
     * @param on_frame Called for every inbound frame, one at a time
     * @param on_close Called exactly once when the socket is gone
     */
    void start(FrameHandler on_frame, CloseHandler on_close);

    /**
     * @brief Close the socket now and release both handlers
     *
     * Runs teardown on the calling thread. Only valid once no thread is
     * running the session's io_context.
     */
    void abort();

    ConnectionId id() const override { return id_; }
    bool send_frame(const std::string& frame) override;
    void close(CloseReason reason) override;
    bool is_open() const override;

    /// Peer address as "host:port" (captured at accept time)
    const std::string& remote_address() const { return remote_address_; }

private:
    ConnectionId id_;
    asio::ip::tcp::socket socket_;
    asio::strand<asio::ip::tcp::socket::executor_type> strand_;
    asio::steady_timer close_timer_;
    asio::streambuf read_buffer_;
    std::string remote_address_;
    size_t queue_limit_;

    FrameHandler frame_handler_;
    CloseHandler close_handler_;

    /// Guards write_queue_, writing_ and closing_
    mutable std::mutex queue_mutex_;
    std::deque<std::string> write_queue_;
    std::string current_write_;
    bool writing_ = false;
    bool closing_ = false;

    std::atomic<bool> closed_{false};

    void do_read();
    void handle_read(const asio::error_code& error, std::size_t bytes_transferred);
    void do_write();
    void finish();

    /// Queue a frame, ignoring the queue limit. Caller holds queue_mutex_.
    void enqueue_locked(std::string frame);
};

} // namespace lusta
