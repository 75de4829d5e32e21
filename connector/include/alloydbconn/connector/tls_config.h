/**
 * @file tls_config.h
 * @brief TLS client configuration with instance-bound peer verification
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_TLS_CONFIG_H
#define ALLOYDBCONN_TLS_CONFIG_H

#include "alloydbconn/common/crypto.h"
#include "alloydbconn/common/instance.h"
#include "alloydbconn/connector/fetch.h"
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace alloydbconn {

/**
 * @brief OpenSSL client context for one instance's server-side proxy
 *
 * The server's address is not a stable identity, so hostname checks are
 * never configured. Instead the certificate-verify callback runs
 * VerifyPeerCertificate() on the chain the server presents. Minimum
 * protocol version is TLS 1.3. The client presents [leaf, intermediate].
 *
 * Sessions created from this configuration must not outlive it.
 */
class TlsConfig {
public:
    ~TlsConfig();

    TlsConfig(const TlsConfig&) = delete;
    TlsConfig& operator=(const TlsConfig&) = delete;

    /**
     * @brief Judge a server certificate chain
     *
     * The first certificate is the server leaf, the rest are untrusted
     * intermediates. The leaf must chain to the fetched root and carry
     * CN = "<instance UID>.server.alloydb".
     *
     * @param raw_certs DER certificates in presentation order
     * @throws DialError if the chain is rejected
     */
    void VerifyPeerCertificate(const std::vector<std::vector<uint8_t>>& raw_certs) const;

    /**
     * @brief Common name the server leaf must carry
     */
    const std::string& ExpectedServerName() const;

    /**
     * @brief Certificates presented to the server: [leaf, intermediate]
     */
    const std::vector<crypto::Certificate>& ClientCertificates() const;

    /**
     * @brief Trust anchor for server verification
     */
    const crypto::Certificate& RootCertificate() const;

    /**
     * @brief Lowest protocol version accepted (OpenSSL version constant)
     */
    int MinProtocolVersion() const;

    /**
     * @brief Create a client SSL handle (SSL*); caller owns it (SSL_free)
     * @throws DialError on failure
     */
    void* NewSession() const;

    /**
     * @brief SSL_CTX* backing this configuration
     */
    void* GetNativeHandle() const;

    /**
     * @brief Error recorded when the verify callback rejected a handshake
     * @param ssl SSL* that failed its handshake
     * @return The DialError, or null if verification did not fail
     */
    static std::exception_ptr PeerVerificationError(const void* ssl);

private:
    class Impl;
    explicit TlsConfig(std::unique_ptr<Impl> impl);

    friend std::shared_ptr<TlsConfig> CreateTlsConfig(
        const InstanceURI& inst,
        CertificateChain chain,
        const ConnectInfo& info,
        const crypto::PrivateKey& key
    );

    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Assemble the TLS configuration for one refresh
 *
 * Synchronous, no network I/O.
 *
 * @param inst Instance, for error messages
 * @param chain Fetched certificates; root becomes the only trust anchor
 * @param info Fetched metadata; supplies the expected server name
 * @param key Private key matching chain.client
 * @throws DialError if OpenSSL rejects the certificates or key
 */
std::shared_ptr<TlsConfig> CreateTlsConfig(
    const InstanceURI& inst,
    CertificateChain chain,
    const ConnectInfo& info,
    const crypto::PrivateKey& key
);

} // namespace alloydbconn

#endif // ALLOYDBCONN_TLS_CONFIG_H
