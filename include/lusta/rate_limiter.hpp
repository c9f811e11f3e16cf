/**
 * @file rate_limiter.hpp
 * @brief Token bucket flood protection per identity
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Configurable sustained frame rate per identity
 * - Burst capacity on top of the sustained rate
 * - Automatic token refill
 * - Thread-safe implementation
 */

#pragma once

#include "lusta/message_types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>

namespace lusta {

/**
 * @brief Token bucket for a single identity
 */
struct TokenBucket {
    double tokens;
    double capacity;
    double refill_rate;     ///< Tokens per second
    std::chrono::steady_clock::time_point last_refill;

    TokenBucket(double rate, double burst)
        : tokens(burst)
        , capacity(burst)
        , refill_rate(rate)
        , last_refill(std::chrono::steady_clock::now())
    {}
};

/**
 * @brief RateLimiter - Token bucket limiting of inbound frames per identity
 *
 * A frame consumes one token; frames arriving on an empty bucket are
 * rejected. Buckets are created full on first use.
 */
class RateLimiter {
public:
    /**
     * @param rate_per_second Sustained frame rate per identity
     * @param burst_capacity Maximum tokens per identity
     */
    explicit RateLimiter(double rate_per_second, double burst_capacity);

    // Disable copy and move
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&) = delete;
    RateLimiter& operator=(RateLimiter&&) = delete;

    /**
     * @brief Consume one token for identity if available
     * @return true if the frame is allowed
     */
    bool allow_frame(UserId identity_id);

    /**
     * @brief Tokens currently available to identity (0 if untracked)
     */
    double available_tokens(UserId identity_id);

    size_t tracked_count() const;

    /**
     * @brief Drop buckets idle for longer than threshold
     * @return Number of buckets removed
     */
    size_t cleanup_inactive(std::chrono::seconds inactive_threshold = std::chrono::minutes(5));

    /**
     * @brief Drop the bucket of one identity
     */
    void forget(UserId identity_id);

private:
    double rate_per_second_;
    double burst_capacity_;

    std::map<UserId, TokenBucket> buckets_;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;

    void refill_tokens(TokenBucket& bucket);
};

} // namespace lusta
