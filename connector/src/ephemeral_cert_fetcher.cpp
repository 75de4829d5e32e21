/**
 * @file ephemeral_cert_fetcher.cpp
 * @brief Ephemeral client certificate retrieval
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/connector/fetch.h"
#include "alloydbconn/common/errors.h"
#include "x509_constants.h"
#include <glog/logging.h>

namespace alloydbconn {

using namespace crypto::internal;

namespace {

crypto::Certificate ParseOne(const InstanceURI& inst, const std::string& pem, const char* failure) {
    try {
        return crypto::Certificate::LoadFromPEM(pem);
    } catch (const crypto::CryptoError&) {
        throw RefreshError(failure, inst.ToString(), std::current_exception());
    }
}

CertificateChain RequestCertificateChain(
    const Context& ctx,
    AdminApiClient& client,
    const InstanceURI& inst,
    const crypto::PrivateKey& key
) {
    crypto::DistinguishedName subject;
    subject.common_name = CSR_COMMON_NAME;
    subject.country = CSR_COUNTRY;
    subject.province = CSR_PROVINCE;
    subject.locality = CSR_LOCALITY;
    subject.organization = CSR_ORGANIZATION;
    subject.organizational_unit = CSR_ORGANIZATIONAL_UNIT;

    std::string csr;
    try {
        csr = crypto::CreateCertificateSigningRequest(key, subject);
    } catch (const crypto::CryptoError&) {
        throw RefreshError("failed to create certificate signing request", inst.ToString(),
                           std::current_exception());
    }

    proto::GenerateClientCertificateResponse resp;
    try {
        resp = client.GenerateClientCertificate(ctx, inst.project(), inst.region(),
                                                inst.cluster(), inst.name(), csr);
    } catch (const std::exception&) {
        throw RefreshError("create ephemeral cert failed", inst.ToString(),
                           std::current_exception());
    }

    return ParseCertificateChain(inst, resp);
}

} // namespace

CertificateChain ParseCertificateChain(
    const InstanceURI& inst,
    const proto::GenerateClientCertificateResponse& response
) {
    // The service always returns [intermediate, root]. Anything else means the
    // API broke its contract with the client.
    if (response.pem_certificate_chain_size() != 2) {
        throw RefreshError("missing instance and root certificates", inst.ToString());
    }

    CertificateChain chain;
    chain.root = ParseOne(inst, response.pem_certificate_chain(1), "failed to parse root cert");
    chain.intermediate = ParseOne(inst, response.pem_certificate_chain(0),
                                  "failed to parse intermediate cert");
    chain.client = ParseOne(inst, response.pem_certificate(), "failed to parse client cert");
    return chain;
}

CertificateChain FetchEphemeralCert(
    const Context& ctx,
    AdminApiClient& client,
    trace::Tracer& tracer,
    const InstanceURI& inst,
    const crypto::PrivateKey& key
) {
    trace::EndSpanFunc end = tracer.StartSpan(trace::SPAN_FETCH_EPHEMERAL_CERT, {});
    try {
        CertificateChain chain = RequestCertificateChain(ctx, client, inst, key);
        VLOG(1) << "[" << inst.ToString() << "] ephemeral certificate issued";
        end(nullptr);
        return chain;
    } catch (const std::exception&) {
        end(std::current_exception());
        throw;
    }
}

} // namespace alloydbconn
