/**
 * @file admin_api.h
 * @brief AlloyDB Admin API client interface and REST codec
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_ADMIN_API_H
#define ALLOYDBCONN_ADMIN_API_H

#include "alloydbconn/common/context.h"
#include "alloydb_admin.pb.h"
#include <stdexcept>
#include <string>

namespace alloydbconn {

/**
 * @brief Admin API call failed
 */
class AdminApiError : public std::runtime_error {
public:
    /**
     * @param status HTTP status code, 0 when no response was received
     * @param message Error description
     */
    AdminApiError(int status, const std::string& message);

    int status() const noexcept { return status_; }

private:
    int status_;
};

/**
 * @brief Access to the AlloyDB Admin API
 *
 * Implementations must be safe for concurrent use: several refreshes may be
 * in flight at once, and calls may still be running after the refresh that
 * issued them gave up. Calls should abort once @p ctx is done.
 */
class AdminApiClient {
public:
    virtual ~AdminApiClient() = default;

    /**
     * @brief Fetch connection metadata of an instance
     * @throws AdminApiError (or another std::exception) on failure
     */
    virtual proto::ConnectionInfo GetConnectionInfo(
        const Context& ctx,
        const std::string& project,
        const std::string& region,
        const std::string& cluster,
        const std::string& name
    ) = 0;

    /**
     * @brief Have the service sign a client certificate for @p pem_csr
     * @throws AdminApiError (or another std::exception) on failure
     */
    virtual proto::GenerateClientCertificateResponse GenerateClientCertificate(
        const Context& ctx,
        const std::string& project,
        const std::string& region,
        const std::string& cluster,
        const std::string& name,
        const std::string& pem_csr
    ) = 0;
};

namespace admin_api {

/**
 * @brief Resource path of GET connectionInfo
 * @return "projects/<p>/locations/<r>/clusters/<c>/instances/<i>/connectionInfo"
 */
std::string ConnectionInfoPath(const std::string& project, const std::string& region,
                               const std::string& cluster, const std::string& name);

/**
 * @brief Resource path of POST generateClientCertificate
 * @return "projects/<p>/locations/<r>/clusters/<c>:generateClientCertificate"
 */
std::string GenerateClientCertificatePath(const std::string& project, const std::string& region,
                                          const std::string& cluster);

/**
 * @brief Serialize a request body as REST JSON
 * @throws AdminApiError on serialization failure
 */
std::string RequestToJson(const proto::GenerateClientCertificateRequest& request);

/**
 * @brief Decode a connectionInfo response body; unknown fields are ignored
 * @throws AdminApiError on malformed JSON
 */
proto::ConnectionInfo ParseConnectionInfo(const std::string& json);

/**
 * @brief Decode a generateClientCertificate response body
 * @throws AdminApiError on malformed JSON
 */
proto::GenerateClientCertificateResponse ParseGenerateClientCertificateResponse(const std::string& json);

} // namespace admin_api
} // namespace alloydbconn

#endif // ALLOYDBCONN_ADMIN_API_H
