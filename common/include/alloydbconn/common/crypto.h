/**
 * @file crypto.h
 * @brief RSA keys, X.509 certificates and certificate signing requests
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_CRYPTO_H
#define ALLOYDBCONN_CRYPTO_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace alloydbconn {
namespace crypto {

/**
 * @brief Cryptographic exceptions
 */
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input did not contain a PEM block
 */
class InvalidPEMError : public CryptoError {
public:
    InvalidPEMError() : CryptoError("certificate is not a valid PEM") {}
};

// RSA modulus size used for ephemeral client keys
constexpr int DEFAULT_RSA_KEY_BITS = 2048;

/**
 * @brief X.509 distinguished name attributes (single-valued)
 */
struct DistinguishedName {
    std::string common_name;
    std::string country;
    std::string province;
    std::string locality;
    std::string organization;
    std::string organizational_unit;
};

/**
 * @brief RSA private key wrapper
 */
class PrivateKey {
public:
    PrivateKey();
    ~PrivateKey();

    PrivateKey(PrivateKey&&) noexcept;
    PrivateKey& operator=(PrivateKey&&) noexcept;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    /**
     * @brief Load private key from PEM buffer
     * @param pem PEM-encoded private key
     * @return Loaded private key
     * @throws CryptoError on parse error
     */
    static PrivateKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Generate new RSA key pair
     * @param bits Modulus size in bits
     * @return Generated private key
     * @throws CryptoError on generation error
     */
    static PrivateKey GenerateRSA(int bits = DEFAULT_RSA_KEY_BITS);

    /**
     * @brief Export to PEM format (PKCS#8)
     * @return PEM-encoded private key
     */
    std::string ToPEM() const;

    /**
     * @brief Export the public half as a PEM SubjectPublicKeyInfo
     */
    std::string PublicKeyToPEM() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Usage a verified leaf certificate must be valid for
 *
 * A leaf without an extendedKeyUsage extension is valid for any purpose.
 */
enum class CertificatePurpose {
    Any,
    ServerAuth,
    ClientAuth
};

/**
 * @brief X.509 certificate wrapper
 */
class Certificate {
public:
    Certificate();
    ~Certificate();

    Certificate(Certificate&&) noexcept;
    Certificate& operator=(Certificate&&) noexcept;
    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    /**
     * @brief Parse the first PEM block of a string as a certificate
     *
     * The block type is not checked; its contents must be a DER certificate.
     *
     * @param pem String containing a PEM block
     * @return Parsed certificate
     * @throws InvalidPEMError if no PEM block is found
     * @throws CryptoError if the block does not hold a certificate
     */
    static Certificate LoadFromPEM(const std::string& pem);

    /**
     * @brief Load certificate chain from PEM string
     *
     * Certificates are returned in the order they appear in the bundle.
     *
     * @param pem PEM string containing one or more certificates
     * @return Vector of certificates
     * @throws CryptoError if no certificate is found
     */
    static std::vector<Certificate> LoadChainFromPEM(const std::string& pem);

    /**
     * @brief Load certificate from DER buffer
     * @param der DER-encoded certificate
     * @return Loaded certificate
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromDER(const std::vector<uint8_t>& der);

    /**
     * @brief Export to DER format
     * @return DER-encoded certificate
     */
    std::vector<uint8_t> ToDER() const;

    /**
     * @brief Export to PEM format
     * @return PEM-encoded certificate
     */
    std::string ToPEM() const;

    /**
     * @brief Create an independent copy
     */
    Certificate Clone() const;

    /**
     * @brief Verify this certificate up to a trusted root
     *
     * Runs OpenSSL path validation (signatures, validity period, CA basic
     * constraints, path length) with @p root_ca as the only trust anchor and
     * @p intermediates as untrusted chain-building candidates.
     *
     * @param intermediates Untrusted intermediate certificates, any order
     * @param root_ca Trust anchor
     * @param trusted_time Unix epoch seconds used for validity checks
     * @param purpose Extended key usage the leaf must allow
     * @return true if the chain is valid
     * @throws CryptoError describing the first verification failure
     */
    bool VerifyChainWithIntermediates(
        const std::vector<Certificate>& intermediates,
        const Certificate& root_ca,
        int64_t trusted_time,
        CertificatePurpose purpose = CertificatePurpose::Any
    ) const;

    /**
     * @brief Get certificate subject distinguished name
     * @return Subject DN string (e.g., "/CN=alloydb-proxy")
     */
    std::string GetSubject() const;

    /**
     * @brief Get the subject common name, empty if absent
     */
    std::string GetCommonName() const;

    /**
     * @brief Get certificate issuer distinguished name
     */
    std::string GetIssuer() const;

    /**
     * @brief Get serial number as upper-case hex
     */
    std::string GetSerialNumber() const;

    /**
     * @brief Get certificate notBefore timestamp
     * @return Unix epoch seconds when certificate becomes valid
     */
    int64_t GetNotBefore() const;

    /**
     * @brief Get certificate notAfter timestamp
     * @return Unix epoch seconds when certificate expires
     */
    int64_t GetNotAfter() const;

    /**
     * @brief Get certificate validity period
     * @return Pair of (notBefore, notAfter) timestamps in Unix epoch seconds
     */
    std::pair<int64_t, int64_t> GetValidityPeriod() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Create a PEM-encoded PKCS#10 certificate signing request
 *
 * The request is signed with SHA-256 using @p key, which must be an RSA key.
 *
 * @param key Key whose public half is certified and which signs the request
 * @param subject Subject distinguished name
 * @return PEM "CERTIFICATE REQUEST" block
 * @throws CryptoError on failure
 */
std::string CreateCertificateSigningRequest(
    const PrivateKey& key,
    const DistinguishedName& subject
);

} // namespace crypto
} // namespace alloydbconn

#endif // ALLOYDBCONN_CRYPTO_H
