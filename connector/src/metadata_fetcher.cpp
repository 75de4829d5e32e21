/**
 * @file metadata_fetcher.cpp
 * @brief Instance metadata retrieval
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/connector/fetch.h"
#include "alloydbconn/common/errors.h"

namespace alloydbconn {

ConnectInfo FetchMetadata(
    const Context& ctx,
    AdminApiClient& client,
    trace::Tracer& tracer,
    const InstanceURI& inst
) {
    trace::EndSpanFunc end = tracer.StartSpan(trace::SPAN_FETCH_METADATA, {});

    proto::ConnectionInfo resp;
    try {
        resp = client.GetConnectionInfo(ctx, inst.project(), inst.region(),
                                        inst.cluster(), inst.name());
    } catch (const std::exception&) {
        RefreshError err("failed to get instance metadata", inst.ToString(),
                         std::current_exception());
        end(std::make_exception_ptr(err));
        throw err;
    }

    end(nullptr);
    return ConnectInfo{resp.ip_address(), resp.instance_uid()};
}

} // namespace alloydbconn
