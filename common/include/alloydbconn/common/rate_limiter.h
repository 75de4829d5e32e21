/**
 * @file rate_limiter.h
 * @brief Token-bucket admission control for refresh attempts
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_RATE_LIMITER_H
#define ALLOYDBCONN_RATE_LIMITER_H

#include "alloydbconn/common/context.h"
#include <chrono>
#include <mutex>
#include <optional>

namespace alloydbconn {

/**
 * @brief Token bucket refilled at one token per interval
 *
 * The bucket starts full with @c burst tokens. Waiters reserve tokens in
 * arrival order, so concurrent callers are admitted first-come first-served.
 * Thread safe.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param interval Time to refill one token (must be positive)
     * @param burst Bucket capacity (must be positive)
     * @throws ConfigError on invalid parameters
     */
    RateLimiter(Clock::duration interval, int burst);

    /**
     * @brief Take a token if one is available now
     */
    bool Allow();

    /**
     * @brief Block until a token is available
     *
     * Fails immediately if @p ctx is done or if its deadline falls before
     * the token would be available. A reservation abandoned because the
     * context finished is returned to the bucket.
     *
     * @return true once a token was taken, false if @p ctx finished first
     */
    bool Wait(Context& ctx);

    /**
     * @brief Tokens currently available (negative while reserved ahead)
     */
    double Tokens() const;

    Clock::duration interval() const { return interval_; }
    int burst() const { return burst_; }

private:
    // Caller holds mu_
    void AdvanceLocked(Clock::time_point now);

    std::optional<Clock::time_point> Reserve(Clock::time_point now, Clock::duration max_wait);
    void CancelReservation(Clock::time_point ready_at);

    const Clock::duration interval_;
    const int burst_;

    mutable std::mutex mu_;
    double tokens_;
    Clock::time_point last_;
};

} // namespace alloydbconn

#endif // ALLOYDBCONN_RATE_LIMITER_H
