/**
 * @file chat_server.cpp
 * @brief Implementation of the LuStA server
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lusta/chat_server.hpp"
#include "lusta/utilities.hpp"

#include <chrono>

namespace lusta {

using namespace lusta::utilities;

ChatServer::ChatServer(
    ServerConfig config,
    MessageStore& store,
    PasswordHasher hasher
)
    : config_(std::move(config))
    , store_(store)
    , auth_(store, std::move(hasher))
    , aggregator_(store)
    , queries_(store, aggregator_)
    , router_(registry_, store, auth_, queries_, RouterOptions::from_config(config_))
{
}

ChatServer::~ChatServer() {
    if (running_) {
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool ChatServer::start() {
    if (running_) {
        log_warn("ChatServer: Already running");
        return false;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);

        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();

        bound_port_ = acceptor_->local_endpoint().port();

    } catch (const std::exception& e) {
        log_error("ChatServer: Failed to listen on " + config_.host + ":" +
                  std::to_string(config_.port) + ": " + e.what());
        acceptor_.reset();
        return false;
    }

    io_context_.restart();

    // Create work guard to keep io_context running
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor()
    );

    running_ = true;
    start_accept();

    size_t num_threads = config_.worker_threads;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
    }
    if (num_threads == 0) num_threads = 2;

    log_info("ChatServer: Starting " + std::to_string(num_threads) + " worker threads");
    for (size_t i = 0; i < num_threads; ++i) {
        worker_threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("ChatServer: Worker thread exception: " + std::string(e.what()));
            }
        });
    }

    log_info("ChatServer: Listening on " + config_.host + ":" + std::to_string(bound_port_.load()));
    return true;
}

void ChatServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    log_info("ChatServer: Stopping server...");

    try {
        if (acceptor_) {
            asio::error_code ec;
            acceptor_->close(ec);
        }

        std::vector<std::shared_ptr<ConnectionSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            for (const auto& [id, session] : sessions_) {
                sessions.push_back(session);
            }
        }
        for (const auto& session : sessions) {
            session->close(CloseReason::SHUTDOWN);
        }

        // Let sessions flush their close frames
        {
            std::unique_lock<std::mutex> lock(sessions_mutex_);
            sessions_cv_.wait_for(
                lock,
                limits::CLOSE_LINGER + std::chrono::milliseconds(500),
                [this]() { return sessions_.empty(); }
            );
            if (!sessions_.empty()) {
                log_warn("ChatServer: " + std::to_string(sessions_.size()) +
                         " connections did not close in time");
            }
        }

        // Stop ASIO work
        work_guard_.reset();
        io_context_.stop();

        // Wait for worker threads
        for (auto& thread : worker_threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        worker_threads_.clear();

        // Sessions still lingering never reached finish() on their strand
        std::vector<std::shared_ptr<ConnectionSession>> remaining;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            for (const auto& [id, session] : sessions_) {
                remaining.push_back(session);
            }
        }
        for (const auto& session : remaining) {
            session->abort();
        }

        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_.clear();
        }
        registry_.clear();
        acceptor_.reset();

        log_info("ChatServer: Stopped successfully");

    } catch (const std::exception& e) {
        log_error("ChatServer: Exception during stop: " + std::string(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        run_cv_.notify_all();
    }
}

void ChatServer::run() {
    if (!running_) {
        log_error("ChatServer: Cannot run - not started");
        return;
    }

    std::unique_lock<std::mutex> lock(run_mutex_);
    run_cv_.wait(lock, [this]() { return !running_; });
}

bool ChatServer::is_running() const {
    return running_;
}

uint16_t ChatServer::port() const {
    return bound_port_;
}

size_t ChatServer::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

// ============================================================================
// Connection Handling
// ============================================================================

void ChatServer::start_accept() {
    acceptor_->async_accept(
        [this](const asio::error_code& error, asio::ip::tcp::socket socket) {
            handle_accept(error, std::move(socket));
        }
    );
}

void ChatServer::handle_accept(const asio::error_code& error, asio::ip::tcp::socket socket) {
    if (!running_) {
        return;
    }

    if (error) {
        if (error != asio::error::operation_aborted) {
            log_warn("ChatServer: Accept failed: " + error.message());
        }
    } else {
        ConnectionId id = next_connection_id_++;
        auto session = std::make_shared<ConnectionSession>(
            id,
            std::move(socket),
            config_.max_frame_size,
            config_.outbound_queue_limit
        );
        auto context = std::make_shared<ConnectionContext>(session);

        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_[id] = session;
        }

        log_debug("ChatServer: Connection " + std::to_string(id) + " from " + session->remote_address());

        session->start(
            [this, context](const std::string& frame) {
                router_.handle_frame(*context, frame);
            },
            [this, context, id]() {
                router_.on_disconnect(*context);
                remove_session(id);
            }
        );
    }

    if (running_) {
        start_accept();
    }
}

void ChatServer::remove_session(ConnectionId id) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(id);
    }
    sessions_cv_.notify_all();
}

} // namespace lusta
