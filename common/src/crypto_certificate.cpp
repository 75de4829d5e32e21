/**
 * @file crypto_certificate.cpp
 * @brief X.509 certificate wrapper implementation (OpenSSL 3.x)
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#include <ctime>

namespace alloydbconn {
namespace crypto {

using namespace internal;

class Certificate::Impl {
public:
    X509* cert = nullptr;

    ~Impl() {
        if (cert) {
            X509_free(cert);
        }
    }
};

Certificate::Certificate() : impl_(std::make_unique<Impl>()) {}

Certificate::~Certificate() = default;

Certificate::Certificate(Certificate&&) noexcept = default;
Certificate& Certificate::operator=(Certificate&&) noexcept = default;

namespace {

int64_t ASN1TimeToEpoch(const ASN1_TIME* t, const char* field) {
    if (!t) {
        throw CryptoError(std::string("Failed to get certificate ") + field + " time");
    }

    struct tm tm_time = {};
    if (!ASN1_TIME_to_tm(t, &tm_time)) {
        throw CryptoError(std::string("Failed to convert ") + field);
    }

    // Convert to Unix epoch (UTC)
    return static_cast<int64_t>(timegm(&tm_time));
}

std::string NameToString(const X509_NAME* name, const char* what) {
    char* str = X509_NAME_oneline(name, nullptr, 0);
    if (!str) {
        throw CryptoError(std::string("Failed to get certificate ") + what);
    }
    std::string result(str);
    OPENSSL_free(str);
    return result;
}

} // namespace

Certificate Certificate::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM data");
    }

    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long len = 0;
    if (!PEM_read_bio(bio.get(), &name, &header, &data, &len)) {
        // "no start line" and base64 errors leave entries on the error queue
        ERR_clear_error();
        throw InvalidPEMError();
    }

    std::vector<uint8_t> der(data, data + len);
    OPENSSL_free(name);
    OPENSSL_free(header);
    OPENSSL_free(data);

    return LoadFromDER(der);
}

std::vector<Certificate> Certificate::LoadChainFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM data");
    }

    std::vector<Certificate> chain;

    // Read all certificates from the PEM data
    while (true) {
        X509* x509 = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
        if (!x509) {
            break;  // No more certificates
        }
        Certificate cert;
        cert.impl_->cert = x509;
        chain.push_back(std::move(cert));
    }
    ERR_clear_error();

    if (chain.empty()) {
        throw CryptoError("No certificates found in PEM data");
    }

    return chain;
}

Certificate Certificate::LoadFromDER(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    Certificate cert;
    cert.impl_->cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));

    if (!cert.impl_->cert) {
        ERR_clear_error();
        throw CryptoError("Failed to parse certificate from DER");
    }

    if (p != der.data() + der.size()) {
        throw CryptoError("Trailing data after DER certificate");
    }

    return cert;
}

std::vector<uint8_t> Certificate::ToDER() const {
    unsigned char* der = nullptr;
    int len = i2d_X509(impl_->cert, &der);

    if (len < 0) {
        throw CryptoError("Failed to encode certificate to DER");
    }

    std::vector<uint8_t> result(der, der + len);
    OPENSSL_free(der);

    return result;
}

std::string Certificate::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_X509(bio.get(), impl_->cert)) {
        throw CryptoError("Failed to write certificate to PEM");
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, len);
}

Certificate Certificate::Clone() const {
    // Clone via DER round-trip (simple and safe)
    return Certificate::LoadFromDER(ToDER());
}

bool Certificate::VerifyChainWithIntermediates(
    const std::vector<Certificate>& intermediates,
    const Certificate& root_ca,
    int64_t trusted_time,
    CertificatePurpose purpose
) const {
    if (!impl_->cert || !root_ca.impl_->cert) {
        throw CryptoError("Chain verification failed: empty certificate");
    }

    X509_STORE_ptr store(X509_STORE_new());
    if (!store || X509_STORE_add_cert(store.get(), root_ca.impl_->cert) != 1) {
        throw CryptoError("Chain verification failed: cannot install root CA");
    }

    X509_STACK_ptr untrusted(sk_X509_new_null());
    if (!untrusted) {
        throw CryptoError("Chain verification failed: cannot allocate intermediate pool");
    }
    for (const auto& intermediate : intermediates) {
        X509* x = intermediate.impl_->cert;
        if (!x) {
            continue;
        }
        X509_up_ref(x);
        if (!sk_X509_push(untrusted.get(), x)) {
            X509_free(x);
            throw CryptoError("Chain verification failed: cannot add intermediate");
        }
    }

    X509_STORE_CTX_ptr ctx(X509_STORE_CTX_new());
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store.get(), impl_->cert, untrusted.get()) != 1) {
        throw CryptoError("Chain verification failed: cannot initialize verification context");
    }
    X509_STORE_CTX_set_time(ctx.get(), 0, static_cast<time_t>(trusted_time));

    int x509_purpose = 0;
    switch (purpose) {
        case CertificatePurpose::ServerAuth:
            x509_purpose = X509_PURPOSE_SSL_SERVER;
            break;
        case CertificatePurpose::ClientAuth:
            x509_purpose = X509_PURPOSE_SSL_CLIENT;
            break;
        case CertificatePurpose::Any:
            break;
    }
    if (x509_purpose != 0 && X509_STORE_CTX_set_purpose(ctx.get(), x509_purpose) != 1) {
        ERR_clear_error();
        throw CryptoError("Chain verification failed: cannot set certificate purpose");
    }

    if (X509_verify_cert(ctx.get()) != 1) {
        int err = X509_STORE_CTX_get_error(ctx.get());
        ERR_clear_error();
        throw CryptoError(std::string("Chain verification failed: ") +
                          X509_verify_cert_error_string(err));
    }

    return true;
}

std::string Certificate::GetSubject() const {
    return NameToString(X509_get_subject_name(impl_->cert), "subject");
}

std::string Certificate::GetCommonName() const {
    X509_NAME* subject = X509_get_subject_name(impl_->cert);
    int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx < 0) {
        return "";
    }

    ASN1_STRING* value = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, idx));
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, value);
    if (len < 0) {
        throw CryptoError("Failed to decode certificate common name");
    }
    std::string result(reinterpret_cast<char*>(utf8), len);
    OPENSSL_free(utf8);
    return result;
}

std::string Certificate::GetIssuer() const {
    return NameToString(X509_get_issuer_name(impl_->cert), "issuer");
}

std::string Certificate::GetSerialNumber() const {
    BIGNUM* bn = ASN1_INTEGER_to_BN(X509_get0_serialNumber(impl_->cert), nullptr);
    if (!bn) {
        throw CryptoError("Failed to read certificate serial number");
    }
    char* hex = BN_bn2hex(bn);
    BN_free(bn);
    if (!hex) {
        throw CryptoError("Failed to encode certificate serial number");
    }
    std::string result(hex);
    OPENSSL_free(hex);
    return result;
}

int64_t Certificate::GetNotBefore() const {
    return ASN1TimeToEpoch(X509_get0_notBefore(impl_->cert), "notBefore");
}

int64_t Certificate::GetNotAfter() const {
    return ASN1TimeToEpoch(X509_get0_notAfter(impl_->cert), "notAfter");
}

std::pair<int64_t, int64_t> Certificate::GetValidityPeriod() const {
    return {GetNotBefore(), GetNotAfter()};
}

void* Certificate::GetNativeHandle() const {
    return impl_->cert;
}

} // namespace crypto
} // namespace alloydbconn
