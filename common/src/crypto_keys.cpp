/**
 * @file crypto_keys.cpp
 * @brief RSA key wrapper and CSR creation (OpenSSL 3.x)
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/rand.h>

namespace alloydbconn {
namespace crypto {

using namespace internal;

namespace {

std::string ReadMemBIO(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) {
        throw CryptoError("Failed to read PEM data from BIO");
    }
    return std::string(data, len);
}

} // namespace

// ============================================================================
// PrivateKey Implementation
// ============================================================================

class PrivateKey::Impl {
public:
    EVP_PKEY* pkey = nullptr;

    ~Impl() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

PrivateKey::PrivateKey() : impl_(std::make_unique<Impl>()) {}

PrivateKey::~PrivateKey() = default;

PrivateKey::PrivateKey(PrivateKey&&) noexcept = default;
PrivateKey& PrivateKey::operator=(PrivateKey&&) noexcept = default;

PrivateKey PrivateKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PrivateKey key;
    key.impl_->pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to parse private key from PEM");
    }

    return key;
}

PrivateKey PrivateKey::GenerateRSA(int bits) {
    // SECURITY: Verify PRNG is properly seeded before generating keys
    if (RAND_status() != 1) {
        throw CryptoError("OpenSSL PRNG not properly seeded - insufficient entropy");
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
    if (!ctx) {
        throw CryptoError("Failed to create RSA context");
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw CryptoError("Failed to initialize RSA keygen");
    }

    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        throw CryptoError("Unsupported RSA key size: " + std::to_string(bits));
    }

    PrivateKey key;
    if (EVP_PKEY_keygen(ctx.get(), &key.impl_->pkey) <= 0) {
        throw CryptoError("Failed to generate RSA key pair");
    }

    return key;
}

std::string PrivateKey::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PrivateKey(bio.get(), impl_->pkey, nullptr, nullptr, 0, nullptr, nullptr)) {
        throw CryptoError("Failed to write private key to PEM");
    }

    return ReadMemBIO(bio.get());
}

std::string PrivateKey::PublicKeyToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), impl_->pkey)) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return ReadMemBIO(bio.get());
}

void* PrivateKey::GetNativeHandle() const {
    return impl_->pkey;
}

// ============================================================================
// Certificate Signing Request
// ============================================================================

namespace {

void AddNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (value.empty()) {
        return;
    }
    if (!X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                    reinterpret_cast<const unsigned char*>(value.c_str()),
                                    -1, -1, 0)) {
        throw CryptoError(std::string("Failed to add subject attribute ") + field);
    }
}

} // namespace

std::string CreateCertificateSigningRequest(
    const PrivateKey& key,
    const DistinguishedName& subject
) {
    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(key.GetNativeHandle());
    if (!pkey) {
        throw CryptoError("Cannot create CSR with an empty key");
    }
    if (!EVP_PKEY_is_a(pkey, "RSA")) {
        throw CryptoError("CSR requires an RSA key (signature algorithm is SHA256-RSA)");
    }

    X509_REQ_ptr req(X509_REQ_new());
    if (!req) {
        throw CryptoError("Failed to create X509_REQ structure");
    }

    // PKCS#10 version 1 is encoded as 0
    if (!X509_REQ_set_version(req.get(), 0)) {
        throw CryptoError("Failed to set CSR version");
    }

    X509_NAME* name = X509_REQ_get_subject_name(req.get());
    AddNameEntry(name, "C", subject.country);
    AddNameEntry(name, "ST", subject.province);
    AddNameEntry(name, "L", subject.locality);
    AddNameEntry(name, "O", subject.organization);
    AddNameEntry(name, "OU", subject.organizational_unit);
    AddNameEntry(name, "CN", subject.common_name);

    if (!X509_REQ_set_pubkey(req.get(), pkey)) {
        throw CryptoError("Failed to set CSR public key");
    }

    if (X509_REQ_sign(req.get(), pkey, EVP_sha256()) <= 0) {
        throw CryptoError("Failed to sign CSR");
    }

    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_X509_REQ(bio.get(), req.get())) {
        throw CryptoError("Failed to write CSR to PEM");
    }

    return ReadMemBIO(bio.get());
}

} // namespace crypto
} // namespace alloydbconn
