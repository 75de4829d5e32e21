/**
 * @file fake_admin_api.h
 * @brief In-process Admin API backed by a TestPKI
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_FAKE_ADMIN_API_H
#define ALLOYDBCONN_FAKE_ADMIN_API_H

#include "alloydbconn/common/admin_api.h"
#include "test_pki.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace alloydbconn {
namespace test_support {

/**
 * @brief AdminApiClient answering with canned REST JSON bodies
 *
 * Bodies go through the admin_api codec, so responses decode the same way
 * real ones do. Every knob may be changed between refreshes; changing them
 * while calls are in flight is not supported.
 */
class FakeAdminApi : public AdminApiClient {
public:
    FakeAdminApi(std::shared_ptr<const TestPKI> pki, std::string ip_address, std::string instance_uid);

    proto::ConnectionInfo GetConnectionInfo(
        const Context& ctx,
        const std::string& project,
        const std::string& region,
        const std::string& cluster,
        const std::string& name
    ) override;

    proto::GenerateClientCertificateResponse GenerateClientCertificate(
        const Context& ctx,
        const std::string& project,
        const std::string& region,
        const std::string& cluster,
        const std::string& name,
        const std::string& pem_csr
    ) override;

    // Failure injection: the call throws this instead of answering
    void FailMetadata(std::exception_ptr error) { metadata_error_ = std::move(error); }
    void FailCertificate(std::exception_ptr error) { cert_error_ = std::move(error); }

    // Replace the generateClientCertificate body wholesale
    void SetCertificateResponseBody(std::string json) { cert_body_ = std::move(json); }

    // Replace pemCertificateChain with @p chain (the client certificate is still signed)
    void SetCertificateChain(std::vector<std::string> chain) { chain_override_ = std::move(chain); }

    // Calls sleep this long (abandoned early if the context finishes)
    void SetMetadataDelay(std::chrono::milliseconds delay) { metadata_delay_ = delay; }
    void SetCertificateDelay(std::chrono::milliseconds delay) { cert_delay_ = delay; }

    void SetCertificateValidity(std::chrono::seconds validity) { validity_ = validity; }

    int metadata_calls() const { return metadata_calls_.load(); }
    int certificate_calls() const { return cert_calls_.load(); }

    /// Path of the last request, as the REST client would build it
    std::string last_metadata_path() const;
    std::string last_certificate_path() const;

    /// CSR of the last generateClientCertificate call
    std::string last_csr() const;

    /// Last issued client certificate (PEM)
    std::string last_client_certificate() const;

private:
    static void Delay(const Context& ctx, std::chrono::milliseconds delay);

    std::shared_ptr<const TestPKI> pki_;
    std::string ip_address_;
    std::string instance_uid_;

    std::exception_ptr metadata_error_;
    std::exception_ptr cert_error_;
    std::optional<std::string> cert_body_;
    std::optional<std::vector<std::string>> chain_override_;
    std::chrono::milliseconds metadata_delay_{0};
    std::chrono::milliseconds cert_delay_{0};
    std::chrono::seconds validity_{std::chrono::hours(1)};

    std::atomic<int> metadata_calls_{0};
    std::atomic<int> cert_calls_{0};

    mutable std::mutex mu_;
    std::string last_metadata_path_;
    std::string last_certificate_path_;
    std::string last_csr_;
    std::string last_client_certificate_;
};

} // namespace test_support
} // namespace alloydbconn

#endif // ALLOYDBCONN_FAKE_ADMIN_API_H
