/**
 * @file connection_session.cpp
 * @brief Implementation of the TCP connection transport
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lusta/connection_session.hpp"
#include "lusta/protocol.hpp"
#include "lusta/server_config.hpp"
#include "lusta/utilities.hpp"

namespace lusta {

using namespace lusta::utilities;

ConnectionSession::ConnectionSession(
    ConnectionId id,
    asio::ip::tcp::socket socket,
    size_t max_frame_size,
    size_t queue_limit
)
    : id_(id)
    , socket_(std::move(socket))
    , strand_(asio::make_strand(socket_.get_executor()))
    , close_timer_(socket_.get_executor())
    , read_buffer_(max_frame_size + 1)
    , queue_limit_(queue_limit)
{
    asio::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    } else {
        remote_address_ = "unknown";
    }
}

void ConnectionSession::start(FrameHandler on_frame, CloseHandler on_close) {
    frame_handler_ = std::move(on_frame);
    close_handler_ = std::move(on_close);

    auto self = shared_from_this();
    asio::post(strand_, [self]() {
        self->do_read();
    });
}

// ============================================================================
// Outbound
// ============================================================================

bool ConnectionSession::send_frame(const std::string& frame) {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    if (closing_ || closed_) {
        return false;
    }

    if (write_queue_.size() >= queue_limit_) {
        log_warn("Outbound queue full on connection " + std::to_string(id_));
        return false;
    }

    enqueue_locked(frame);
    return true;
}

void ConnectionSession::close(CloseReason reason) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closing_ || closed_) {
            return;
        }
        closing_ = true;
        enqueue_locked(frames::close(reason));
    }

    log_debug("Closing connection " + std::to_string(id_) + " (" +
              close_reason_to_string(reason) + ")");

    auto self = shared_from_this();
    asio::post(strand_, [self]() {
        if (self->closed_) {
            return;
        }
        self->close_timer_.expires_after(limits::CLOSE_LINGER);
        self->close_timer_.async_wait(asio::bind_executor(self->strand_,
            [self](const asio::error_code& error) {
                if (error != asio::error::operation_aborted) {
                    self->finish();
                }
            }
        ));
    });
}

bool ConnectionSession::is_open() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return !closing_ && !closed_;
}

void ConnectionSession::enqueue_locked(std::string frame) {
    frame.push_back('\n');
    write_queue_.push_back(std::move(frame));

    if (!writing_) {
        writing_ = true;
        auto self = shared_from_this();
        asio::post(strand_, [self]() {
            self->do_write();
        });
    }
}

void ConnectionSession::do_write() {
    bool drained_while_closing = false;
    bool have_frame = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_) {
            writing_ = false;
            return;
        }
        if (write_queue_.empty()) {
            writing_ = false;
            drained_while_closing = closing_;
        } else {
            current_write_ = std::move(write_queue_.front());
            write_queue_.pop_front();
            have_frame = true;
        }
    }

    if (drained_while_closing) {
        finish();
        return;
    }
    if (!have_frame) {
        return;
    }

    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(current_write_),
        asio::bind_executor(strand_, [self](const asio::error_code& error, std::size_t) {
            if (error) {
                if (error != asio::error::operation_aborted) {
                    log_debug("Write failed on connection " + std::to_string(self->id_) +
                              ": " + error.message());
                }
                self->finish();
                return;
            }
            self->do_write();
        })
    );
}

// ============================================================================
// Inbound
// ============================================================================

void ConnectionSession::do_read() {
    auto self = shared_from_this();
    asio::async_read_until(
        socket_,
        read_buffer_,
        '\n',
        asio::bind_executor(strand_, [self](const asio::error_code& error, std::size_t bytes_transferred) {
            self->handle_read(error, bytes_transferred);
        })
    );
}

void ConnectionSession::handle_read(const asio::error_code& error, std::size_t bytes_transferred) {
    if (closed_) {
        return;
    }

    if (error == asio::error::not_found) {
        log_warn("Frame exceeds size limit on connection " + std::to_string(id_));
        if (!send_frame(frames::error(ErrorCode::PROTOCOL_ERROR, "frame too large"))) {
            log_debug("Error frame dropped on connection " + std::to_string(id_));
        }
        close(CloseReason::PROTOCOL_ERROR);
        return;
    }

    if (error) {
        if (error != asio::error::eof && error != asio::error::operation_aborted) {
            log_debug("Read failed on connection " + std::to_string(id_) + ": " + error.message());
        }
        finish();
        return;
    }

    auto begin = asio::buffers_begin(read_buffer_.data());
    std::string frame(begin, begin + bytes_transferred - 1);
    read_buffer_.consume(bytes_transferred);

    if (!frame.empty() && frame.back() == '\r') {
        frame.pop_back();
    }

    // Blank lines are keep-alives
    if (!trim_string(frame).empty() && frame_handler_) {
        try {
            frame_handler_(frame);
        } catch (const std::exception& e) {
            log_error("Frame handler failed on connection " + std::to_string(id_) + ": " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closing_ || closed_) {
            return;
        }
    }
    do_read();
}

// ============================================================================
// Teardown
// ============================================================================

void ConnectionSession::abort() {
    finish();
}

void ConnectionSession::finish() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        closing_ = true;
        write_queue_.clear();
    }

    close_timer_.cancel();

    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    log_debug("Connection " + std::to_string(id_) + " from " + remote_address_ + " closed");

    // Handlers capture the session; release them so it can be destroyed
    frame_handler_ = nullptr;
    CloseHandler on_close = std::move(close_handler_);
    close_handler_ = nullptr;
    if (on_close) {
        on_close();
    }
}

} // namespace lusta
