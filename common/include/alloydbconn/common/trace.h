/**
 * @file trace.h
 * @brief Tracing hooks for refresh operations
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_TRACE_H
#define ALLOYDBCONN_TRACE_H

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace alloydbconn {
namespace trace {

// Span names
constexpr const char* SPAN_REFRESH_CONNECTION = "alloydbconn/internal.RefreshConnection";
constexpr const char* SPAN_FETCH_METADATA = "alloydbconn/internal.FetchMetadata";
constexpr const char* SPAN_FETCH_EPHEMERAL_CERT = "alloydbconn/internal.FetchEphemeralCert";

// Span attribute carrying the instance URI
constexpr const char* ATTR_INSTANCE = "/alloydb/instance";

using Attributes = std::map<std::string, std::string>;

/**
 * @brief Ends a span; receives the operation's error or null on success
 */
using EndSpanFunc = std::function<void(std::exception_ptr)>;

/**
 * @brief Tracing backend
 *
 * Implementations must be safe to call from several threads.
 */
class Tracer {
public:
    virtual ~Tracer() = default;

    virtual EndSpanFunc StartSpan(const std::string& name, const Attributes& attributes) = 0;

    /**
     * @brief Record the outcome of one refresh
     *
     * Called from a detached thread; must not assume the refresher is alive.
     */
    virtual void RecordRefreshResult(
        const std::string& instance,
        const std::string& dialer_id,
        std::exception_ptr error
    ) = 0;
};

/**
 * @brief Tracer reporting through glog
 *
 * Successful spans are logged at VLOG(1) with their duration, failed spans
 * and refreshes at WARNING.
 */
std::shared_ptr<Tracer> CreateLoggingTracer();

/**
 * @brief Tracer that records nothing
 */
std::shared_ptr<Tracer> CreateNoopTracer();

} // namespace trace
} // namespace alloydbconn

#endif // ALLOYDBCONN_TRACE_H
