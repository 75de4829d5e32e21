/**
 * @file fetch.h
 * @brief Instance metadata and ephemeral certificate retrieval
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_FETCH_H
#define ALLOYDBCONN_FETCH_H

#include "alloydbconn/common/admin_api.h"
#include "alloydbconn/common/context.h"
#include "alloydbconn/common/crypto.h"
#include "alloydbconn/common/instance.h"
#include "alloydbconn/common/trace.h"
#include <string>

namespace alloydbconn {

/**
 * @brief Where and who the instance is, as of one metadata fetch
 */
struct ConnectInfo {
    std::string ip_address;
    std::string instance_uid;
};

/**
 * @brief Certificates returned by generateClientCertificate
 */
struct CertificateChain {
    crypto::Certificate root;
    crypto::Certificate intermediate;
    crypto::Certificate client;
};

/**
 * @brief Resolve an instance to its address and UID
 *
 * Traced as SPAN_FETCH_METADATA. No retries.
 *
 * @throws RefreshError wrapping the Admin API failure
 */
ConnectInfo FetchMetadata(
    const Context& ctx,
    AdminApiClient& client,
    trace::Tracer& tracer,
    const InstanceURI& inst
);

/**
 * @brief Obtain a freshly signed client certificate for @p key
 *
 * Sends a SHA256-RSA CSR with the fixed "alloydb-proxy" subject. The
 * response must hold exactly two chain certificates ([intermediate, root])
 * plus the client certificate, and all three must parse. Traced as
 * SPAN_FETCH_EPHEMERAL_CERT.
 *
 * @throws RefreshError naming the failed step
 */
CertificateChain FetchEphemeralCert(
    const Context& ctx,
    AdminApiClient& client,
    trace::Tracer& tracer,
    const InstanceURI& inst,
    const crypto::PrivateKey& key
);

/**
 * @brief Validate a generateClientCertificate response into a chain
 *
 * The checks FetchEphemeralCert applies to every response.
 *
 * @throws RefreshError on a wrong certificate count or unparsable certificate
 */
CertificateChain ParseCertificateChain(
    const InstanceURI& inst,
    const proto::GenerateClientCertificateResponse& response
);

} // namespace alloydbconn

#endif // ALLOYDBCONN_FETCH_H
