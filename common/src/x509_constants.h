/**
 * @file x509_constants.h
 * @brief Fixed X.509 names used by the refresh path
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_X509_CONSTANTS_H
#define ALLOYDBCONN_X509_CONSTANTS_H

namespace alloydbconn {
namespace crypto {
namespace internal {

// Subject of every ephemeral client CSR. The service ignores it and issues
// the certificate for the calling principal, but the CSR must carry one.
constexpr const char* CSR_COMMON_NAME = "alloydb-proxy";
constexpr const char* CSR_COUNTRY = "US";
constexpr const char* CSR_PROVINCE = "CA";
constexpr const char* CSR_LOCALITY = "Sunnyvale";
constexpr const char* CSR_ORGANIZATION = "Google LLC";
constexpr const char* CSR_ORGANIZATIONAL_UNIT = "Cloud";

// Server certificates carry CN = "<instance UID>" + SERVER_CN_SUFFIX
constexpr const char* SERVER_CN_SUFFIX = ".server.alloydb";

} // namespace internal
} // namespace crypto
} // namespace alloydbconn

#endif // ALLOYDBCONN_X509_CONSTANTS_H
