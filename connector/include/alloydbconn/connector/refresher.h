/**
 * @file refresher.h
 * @brief Rate-limited refresh of instance address and client certificate
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_REFRESHER_H
#define ALLOYDBCONN_REFRESHER_H

#include "alloydbconn/common/admin_api.h"
#include "alloydbconn/common/config.h"
#include "alloydbconn/common/context.h"
#include "alloydbconn/common/crypto.h"
#include "alloydbconn/common/instance.h"
#include "alloydbconn/common/rate_limiter.h"
#include "alloydbconn/common/trace.h"
#include "alloydbconn/connector/tls_config.h"
#include <chrono>
#include <memory>
#include <string>

namespace alloydbconn {

/**
 * @brief Outcome of one successful refresh
 */
struct RefreshResult {
    std::string ip_address;
    std::shared_ptr<TlsConfig> tls_config;

    /// notAfter of the embedded client certificate; epoch if none is embedded
    std::chrono::system_clock::time_point expiry;
};

/**
 * @brief Performs refreshes for any number of instances
 *
 * One Refresher is shared by a dialer. All refreshes go through the same
 * rate limiter. Thread safe.
 */
class Refresher {
public:
    /**
     * @param client Admin API access
     * @param timeout Upper bound of one refresh
     * @param interval Refill period of the rate limiter
     * @param burst Capacity of the rate limiter
     * @param dialer_id Reported with every refresh result
     * @param tracer Tracing backend; a no-op tracer when null
     * @throws ConfigError if the limiter parameters are invalid
     */
    Refresher(
        std::shared_ptr<AdminApiClient> client,
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds interval,
        int burst,
        std::string dialer_id,
        std::shared_ptr<trace::Tracer> tracer = nullptr
    );

    Refresher(
        std::shared_ptr<AdminApiClient> client,
        const RefresherOptions& options,
        std::shared_ptr<trace::Tracer> tracer = nullptr
    );

    /**
     * @brief Use @p limiter instead of a limiter of the refresher's own
     *
     * Lets several refreshers share one admission budget.
     */
    Refresher(
        std::shared_ptr<AdminApiClient> client,
        std::chrono::milliseconds timeout,
        std::shared_ptr<RateLimiter> limiter,
        std::string dialer_id,
        std::shared_ptr<trace::Tracer> tracer = nullptr
    );

    /**
     * @brief Fetch metadata and a new client certificate, build TLS config
     *
     * Both fetches run concurrently under one deadline, at most @c timeout
     * from now. Nothing is retried.
     *
     * @param ctx Caller context; canceling it aborts the refresh
     * @param inst Instance to refresh
     * @param key Key the client certificate is issued for (RSA)
     * @throws ContextError if @p ctx is already done
     * @throws DialError if throttled until the deadline, or if the TLS
     *         configuration cannot be built
     * @throws RefreshError if a fetch fails or the deadline passes mid-fetch
     */
    RefreshResult PerformRefresh(
        const std::shared_ptr<Context>& ctx,
        const InstanceURI& inst,
        std::shared_ptr<const crypto::PrivateKey> key
    );

    std::chrono::milliseconds timeout() const { return timeout_; }
    const std::string& dialer_id() const { return dialer_id_; }
    const std::shared_ptr<RateLimiter>& limiter() const { return limiter_; }

private:
    std::shared_ptr<AdminApiClient> client_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<RateLimiter> limiter_;
    std::string dialer_id_;
    std::shared_ptr<trace::Tracer> tracer_;
};

} // namespace alloydbconn

#endif // ALLOYDBCONN_REFRESHER_H
