/**
 * @file refresher.cpp
 * @brief Rate-limited refresh of instance address and client certificate
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/connector/refresher.h"
#include "alloydbconn/common/completion_slot.h"
#include "alloydbconn/common/errors.h"
#include "alloydbconn/connector/fetch.h"
#include <glog/logging.h>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

namespace alloydbconn {

namespace {

template <typename T>
struct FetchOutcome {
    std::optional<T> value;
    std::exception_ptr error;
};

using MetadataSlot = CompletionSlot<FetchOutcome<ConnectInfo>>;
using CertificateSlot = CompletionSlot<FetchOutcome<CertificateChain>>;

struct RefreshInputs {
    std::shared_ptr<AdminApiClient> client;
    std::shared_ptr<trace::Tracer> tracer;
    std::shared_ptr<RateLimiter> limiter;
    std::chrono::milliseconds timeout;
};

// Fetches own copies of everything they touch; the refresh that started
// them may return before they finish.
void StartMetadataFetch(
    const RefreshInputs& in,
    std::shared_ptr<Context> ctx,
    const InstanceURI& inst,
    MetadataSlot slot
) {
    std::thread([client = in.client, tracer = in.tracer, ctx = std::move(ctx), inst, slot]() mutable {
        FetchOutcome<ConnectInfo> outcome;
        try {
            outcome.value = FetchMetadata(*ctx, *client, *tracer, inst);
        } catch (const std::exception&) {
            outcome.error = std::current_exception();
        }
        slot.Send(std::move(outcome));
    }).detach();
}

void StartCertificateFetch(
    const RefreshInputs& in,
    std::shared_ptr<Context> ctx,
    const InstanceURI& inst,
    std::shared_ptr<const crypto::PrivateKey> key,
    CertificateSlot slot
) {
    std::thread([client = in.client, tracer = in.tracer, ctx = std::move(ctx), inst,
                 key = std::move(key), slot]() mutable {
        FetchOutcome<CertificateChain> outcome;
        try {
            outcome.value = FetchEphemeralCert(*ctx, *client, *tracer, inst, *key);
        } catch (const std::exception&) {
            outcome.error = std::current_exception();
        }
        slot.Send(std::move(outcome));
    }).detach();
}

std::exception_ptr ContextFailure(const Context& ctx) {
    return std::make_exception_ptr(ContextError(ctx.State()));
}

RefreshResult RunRefresh(
    const RefreshInputs& in,
    const std::shared_ptr<Context>& parent,
    const InstanceURI& inst,
    std::shared_ptr<const crypto::PrivateKey> key
) {
    std::shared_ptr<Context> ctx = Context::WithTimeout(parent, in.timeout);
    ScopedCancel cancel_on_return(ctx);
    ctx->ThrowIfDone();

    if (!in.limiter->Wait(*ctx)) {
        throw DialError("refresh was throttled until context expired", inst.ToString());
    }

    MetadataSlot metadata_slot;
    CertificateSlot cert_slot;
    StartMetadataFetch(in, ctx, inst, metadata_slot);
    StartCertificateFetch(in, ctx, inst, key, cert_slot);

    std::optional<FetchOutcome<ConnectInfo>> metadata = metadata_slot.Receive(*ctx);
    if (!metadata) {
        throw RefreshError("refresh failed", inst.ToString(), ContextFailure(*ctx));
    }
    if (metadata->error) {
        throw RefreshError("failed to get instance IP address", inst.ToString(), metadata->error);
    }

    std::optional<FetchOutcome<CertificateChain>> certs = cert_slot.Receive(*ctx);
    if (!certs) {
        throw RefreshError("refresh failed", inst.ToString(), ContextFailure(*ctx));
    }
    if (certs->error) {
        throw RefreshError("fetch ephemeral cert failed", inst.ToString(), certs->error);
    }

    ConnectInfo info = std::move(*metadata->value);
    std::shared_ptr<TlsConfig> config =
        CreateTlsConfig(inst, std::move(*certs->value), info, *key);

    RefreshResult result;
    result.ip_address = info.ip_address;
    result.tls_config = config;
    const auto& embedded = config->ClientCertificates();
    if (!embedded.empty()) {
        result.expiry = std::chrono::system_clock::from_time_t(
            static_cast<time_t>(embedded.front().GetNotAfter()));
    }
    return result;
}

} // namespace

// ============================================================================
// Refresher
// ============================================================================

Refresher::Refresher(
    std::shared_ptr<AdminApiClient> client,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds interval,
    int burst,
    std::string dialer_id,
    std::shared_ptr<trace::Tracer> tracer
) : Refresher(std::move(client), timeout, std::make_shared<RateLimiter>(interval, burst),
              std::move(dialer_id), std::move(tracer)) {}

Refresher::Refresher(
    std::shared_ptr<AdminApiClient> client,
    const RefresherOptions& options,
    std::shared_ptr<trace::Tracer> tracer
) : Refresher(std::move(client), options.refresh_timeout, options.refresh_interval,
              options.refresh_burst, options.dialer_id, std::move(tracer)) {}

Refresher::Refresher(
    std::shared_ptr<AdminApiClient> client,
    std::chrono::milliseconds timeout,
    std::shared_ptr<RateLimiter> limiter,
    std::string dialer_id,
    std::shared_ptr<trace::Tracer> tracer
) : client_(std::move(client))
  , timeout_(timeout)
  , limiter_(std::move(limiter))
  , dialer_id_(std::move(dialer_id))
  , tracer_(tracer ? std::move(tracer) : trace::CreateNoopTracer()) {
    if (!client_) {
        throw ConfigError("refresher requires an Admin API client");
    }
    if (!limiter_) {
        throw ConfigError("refresher requires a rate limiter");
    }
    if (timeout_.count() <= 0) {
        throw ConfigError("refresh timeout must be positive");
    }
}

RefreshResult Refresher::PerformRefresh(
    const std::shared_ptr<Context>& ctx,
    const InstanceURI& inst,
    std::shared_ptr<const crypto::PrivateKey> key
) {
    if (!key) {
        throw std::invalid_argument("PerformRefresh requires a private key");
    }

    std::string instance = inst.ToString();
    trace::EndSpanFunc end = tracer_->StartSpan(trace::SPAN_REFRESH_CONNECTION,
                                                {{trace::ATTR_INSTANCE, instance}});

    // The result is recorded from a detached thread
    auto report = [this, &instance, &end](std::exception_ptr error) {
        std::thread([tracer = tracer_, instance, dialer_id = dialer_id_, error] {
            tracer->RecordRefreshResult(instance, dialer_id, error);
        }).detach();
        end(error);
    };

    RefreshInputs in{client_, tracer_, limiter_, timeout_};
    RefreshResult result;
    try {
        result = RunRefresh(in, ctx, inst, std::move(key));
    } catch (const std::exception&) {
        report(std::current_exception());
        throw;
    }

    VLOG(1) << "[" << instance << "] refreshed, address " << result.ip_address
            << ", certificate valid for "
            << std::chrono::duration_cast<std::chrono::minutes>(
                   result.expiry - std::chrono::system_clock::now()).count()
            << "m";
    report(nullptr);
    return result;
}

} // namespace alloydbconn
