/**
 * @file rate_limiter.cpp
 * @brief Token-bucket admission control for refresh attempts
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/rate_limiter.h"
#include "alloydbconn/common/errors.h"
#include <algorithm>
#include <string>

namespace alloydbconn {

RateLimiter::RateLimiter(Clock::duration interval, int burst)
    : interval_(interval)
    , burst_(burst)
    , tokens_(static_cast<double>(burst))
    , last_(Clock::now()) {
    if (interval <= Clock::duration::zero()) {
        throw ConfigError("rate limiter interval must be positive");
    }
    if (burst <= 0) {
        throw ConfigError("rate limiter burst must be positive, got " + std::to_string(burst));
    }
}

void RateLimiter::AdvanceLocked(Clock::time_point now) {
    if (now <= last_) {
        return;
    }
    std::chrono::duration<double> elapsed = now - last_;
    std::chrono::duration<double> per_token = interval_;
    tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed / per_token);
    last_ = now;
}

bool RateLimiter::Allow() {
    std::lock_guard<std::mutex> lock(mu_);
    AdvanceLocked(Clock::now());
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

std::optional<RateLimiter::Clock::time_point> RateLimiter::Reserve(
    Clock::time_point now,
    Clock::duration max_wait
) {
    std::lock_guard<std::mutex> lock(mu_);
    AdvanceLocked(now);

    double remaining = tokens_ - 1.0;
    Clock::duration wait = Clock::duration::zero();
    if (remaining < 0) {
        wait = std::chrono::duration_cast<Clock::duration>(-remaining * interval_);
    }
    if (wait > max_wait) {
        return std::nullopt;
    }

    tokens_ = remaining;
    return now + wait;
}

void RateLimiter::CancelReservation(Clock::time_point ready_at) {
    std::lock_guard<std::mutex> lock(mu_);
    Clock::time_point now = Clock::now();
    if (ready_at <= now) {
        // Token was already due; nothing to give back
        return;
    }
    AdvanceLocked(now);
    tokens_ = std::min(static_cast<double>(burst_), tokens_ + 1.0);
}

bool RateLimiter::Wait(Context& ctx) {
    if (ctx.Done()) {
        return false;
    }

    Clock::time_point now = Clock::now();
    Clock::duration max_wait = Clock::duration::max();
    if (auto deadline = ctx.Deadline()) {
        max_wait = *deadline - now;
    }

    std::optional<Clock::time_point> ready_at = Reserve(now, max_wait);
    if (!ready_at) {
        return false;
    }
    if (*ready_at <= now) {
        return true;
    }

    if (ctx.WaitUntil(*ready_at)) {
        CancelReservation(*ready_at);
        return false;
    }
    return true;
}

double RateLimiter::Tokens() const {
    std::lock_guard<std::mutex> lock(mu_);
    Clock::time_point now = Clock::now();
    if (now <= last_) {
        return tokens_;
    }
    std::chrono::duration<double> elapsed = now - last_;
    std::chrono::duration<double> per_token = interval_;
    return std::min(static_cast<double>(burst_), tokens_ + elapsed / per_token);
}

} // namespace alloydbconn
