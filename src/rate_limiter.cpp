/**
 * @file rate_limiter.cpp
 * @brief Implementation of per-identity token bucket limiting
 *
 * LuStA - Direct Messaging Routing Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lusta/rate_limiter.hpp"

#include <algorithm>

namespace lusta {

RateLimiter::RateLimiter(double rate_per_second, double burst_capacity)
    : rate_per_second_(rate_per_second)
    , burst_capacity_(burst_capacity)
{
}

bool RateLimiter::allow_frame(UserId identity_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(identity_id);
    if (it == buckets_.end()) {
        it = buckets_.emplace(identity_id, TokenBucket(rate_per_second_, burst_capacity_)).first;
    }

    TokenBucket& bucket = it->second;
    refill_tokens(bucket);

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }

    return false;
}

double RateLimiter::available_tokens(UserId identity_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(identity_id);
    if (it == buckets_.end()) {
        return 0.0;
    }

    refill_tokens(it->second);
    return it->second.tokens;
}

void RateLimiter::refill_tokens(TokenBucket& bucket) {
    auto now = std::chrono::steady_clock::now();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - bucket.last_refill
    ).count();

    if (elapsed > 0) {
        double tokens_to_add = (elapsed / 1000.0) * bucket.refill_rate;
        bucket.tokens = std::min(bucket.tokens + tokens_to_add, bucket.capacity);
        bucket.last_refill = now;
    }
}

size_t RateLimiter::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

size_t RateLimiter::cleanup_inactive(std::chrono::seconds inactive_threshold) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;

    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        if (now - it->second.last_refill > inactive_threshold) {
            it = buckets_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

void RateLimiter::forget(UserId identity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    buckets_.erase(identity_id);
}

} // namespace lusta
