/**
 * @file test_pki.h
 * @brief Throwaway RSA certificate hierarchy for tests
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_TEST_PKI_H
#define ALLOYDBCONN_TEST_PKI_H

#include "alloydbconn/common/crypto.h"
#include <chrono>
#include <memory>
#include <string>

namespace alloydbconn {
namespace test_support {

/**
 * @brief Key and the certificate issued for it
 */
struct Issued {
    crypto::PrivateKey key;
    crypto::Certificate cert;
};

/**
 * @brief Fields of a PKCS#10 request, as read by OpenSSL
 */
struct CsrDetails {
    std::string subject;          // X509_NAME_oneline form
    std::string signature_algorithm;  // long name, e.g. "sha256WithRSAEncryption"
    bool signature_valid = false;
};

/**
 * @brief Root CA -> intermediate CA, both RSA
 *
 * Mirrors the hierarchy the Admin API signs client and server
 * certificates with. Safe for concurrent signing.
 */
class TestPKI {
public:
    TestPKI();

    const crypto::Certificate& Root() const { return root_.cert; }
    const crypto::Certificate& Intermediate() const { return intermediate_.cert; }
    const Issued& IntermediateIssued() const { return intermediate_; }

    /**
     * @brief Sign a client CSR with the intermediate CA
     * @param csr_pem PEM certificate request
     * @param validity Lifetime of the issued certificate
     * @return PEM client certificate
     */
    std::string SignClientCSR(const std::string& csr_pem,
                              std::chrono::seconds validity = std::chrono::hours(1)) const;

    /**
     * @brief Issue a server leaf with CN = @p common_name from the intermediate
     */
    Issued IssueServer(const std::string& common_name,
                       std::chrono::seconds validity = std::chrono::hours(1)) const;

    /**
     * @brief Issue a certificate for an existing key from the intermediate
     */
    crypto::Certificate IssueFor(const crypto::PrivateKey& key, const std::string& common_name,
                                 std::chrono::seconds not_before_offset,
                                 std::chrono::seconds validity) const;

    /**
     * @brief Self-signed CA outside this hierarchy
     */
    static Issued CreateRootCA(const std::string& common_name);

    /**
     * @brief Intermediate CA issued by @p issuer
     */
    static Issued CreateIntermediateCA(const Issued& issuer, const std::string& common_name);

    /**
     * @brief Leaf issued by @p issuer
     * @param ext_key_usage extendedKeyUsage value, e.g. "clientAuth"
     */
    static Issued IssueLeaf(const Issued& issuer, const std::string& common_name,
                            std::chrono::seconds validity = std::chrono::hours(1),
                            const std::string& ext_key_usage = "serverAuth,clientAuth");

    static CsrDetails InspectCSR(const std::string& csr_pem);

private:
    Issued root_;
    Issued intermediate_;
};

/**
 * @brief Key shared by every test in a process; RSA generation is slow
 */
std::shared_ptr<const crypto::PrivateKey> SharedClientKey();

} // namespace test_support
} // namespace alloydbconn

#endif // ALLOYDBCONN_TEST_PKI_H
