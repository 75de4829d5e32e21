/**
 * @file tls_config.cpp
 * @brief TLS client configuration with instance-bound peer verification
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/connector/tls_config.h"
#include "alloydbconn/common/errors.h"
#include "openssl_wrappers.h"
#include "x509_constants.h"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <glog/logging.h>
#include <ctime>
#include <utility>

namespace alloydbconn {

using namespace crypto::internal;

namespace {

void FreeVerifyError(void*, void* ptr, CRYPTO_EX_DATA*, int, long, void*) {
    delete static_cast<std::exception_ptr*>(ptr);
}

// SSL ex_data slot holding a heap std::exception_ptr from the verify callback
int VerifyErrorIndex() {
    static const int index = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, FreeVerifyError);
    return index;
}

void RecordVerifyError(SSL* ssl, std::exception_ptr error) {
    int index = VerifyErrorIndex();
    delete static_cast<std::exception_ptr*>(SSL_get_ex_data(ssl, index));
    SSL_set_ex_data(ssl, index, new std::exception_ptr(std::move(error)));
}

std::vector<uint8_t> EncodeDER(X509* cert) {
    unsigned char* der = nullptr;
    int len = i2d_X509(cert, &der);
    if (len < 0) {
        return {};
    }
    std::vector<uint8_t> result(der, der + len);
    OPENSSL_free(der);
    return result;
}

} // namespace

class TlsConfig::Impl {
public:
    std::string instance;
    std::string server_name;
    crypto::Certificate root;
    std::vector<crypto::Certificate> client_chain;
    SSL_CTX_ptr ctx;

    void Verify(const std::vector<std::vector<uint8_t>>& raw_certs) const;

    static int VerifyCallback(X509_STORE_CTX* store_ctx, void* arg);
};

void TlsConfig::Impl::Verify(const std::vector<std::vector<uint8_t>>& raw_certs) const {
    if (raw_certs.empty()) {
        throw DialError("no certificates presented", instance);
    }

    std::vector<crypto::Certificate> parsed;
    parsed.reserve(raw_certs.size());
    for (const auto& raw : raw_certs) {
        try {
            parsed.push_back(crypto::Certificate::LoadFromDER(raw));
        } catch (const crypto::CryptoError&) {
            throw DialError("failed to parse X.509 certificate", instance, std::current_exception());
        }
    }

    crypto::Certificate server = std::move(parsed.front());
    std::vector<crypto::Certificate> intermediates;
    for (size_t i = 1; i < parsed.size(); i++) {
        intermediates.push_back(std::move(parsed[i]));
    }

    try {
        server.VerifyChainWithIntermediates(intermediates, root, time(nullptr),
                                            crypto::CertificatePurpose::ServerAuth);
    } catch (const crypto::CryptoError&) {
        throw DialError("failed to verify certificate", instance, std::current_exception());
    }

    // Hostname verification is off, so the CN is what binds the chain to
    // this particular instance.
    std::string cn = server.GetCommonName();
    if (cn != server_name) {
        throw DialError("certificate had CN \"" + cn + "\", expected \"" + server_name + "\"",
                        instance);
    }
}

int TlsConfig::Impl::VerifyCallback(X509_STORE_CTX* store_ctx, void* arg) {
    const Impl* impl = static_cast<const Impl*>(arg);

    // For a client handshake the untrusted stack is the server's chain as
    // presented, leaf first.
    std::vector<std::vector<uint8_t>> raw_certs;
    STACK_OF(X509)* presented = X509_STORE_CTX_get0_untrusted(store_ctx);
    if (presented && sk_X509_num(presented) > 0) {
        for (int i = 0; i < sk_X509_num(presented); i++) {
            raw_certs.push_back(EncodeDER(sk_X509_value(presented, i)));
        }
    } else if (X509* leaf = X509_STORE_CTX_get0_cert(store_ctx)) {
        raw_certs.push_back(EncodeDER(leaf));
    }

    try {
        impl->Verify(raw_certs);
        return 1;
    } catch (const std::exception& e) {
        SSL* ssl = static_cast<SSL*>(
            X509_STORE_CTX_get_ex_data(store_ctx, SSL_get_ex_data_X509_STORE_CTX_idx()));
        if (ssl) {
            RecordVerifyError(ssl, std::current_exception());
        }
        VLOG(1) << "rejected server certificate: " << e.what();
        X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }
}

// ============================================================================
// TlsConfig
// ============================================================================

TlsConfig::TlsConfig(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

TlsConfig::~TlsConfig() = default;

void TlsConfig::VerifyPeerCertificate(const std::vector<std::vector<uint8_t>>& raw_certs) const {
    impl_->Verify(raw_certs);
}

const std::string& TlsConfig::ExpectedServerName() const {
    return impl_->server_name;
}

const std::vector<crypto::Certificate>& TlsConfig::ClientCertificates() const {
    return impl_->client_chain;
}

const crypto::Certificate& TlsConfig::RootCertificate() const {
    return impl_->root;
}

int TlsConfig::MinProtocolVersion() const {
    return static_cast<int>(SSL_CTX_get_min_proto_version(impl_->ctx.get()));
}

void* TlsConfig::NewSession() const {
    SSL* ssl = SSL_new(impl_->ctx.get());
    if (!ssl) {
        ERR_clear_error();
        throw DialError("failed to create TLS session", impl_->instance);
    }
    return ssl;
}

void* TlsConfig::GetNativeHandle() const {
    return impl_->ctx.get();
}

std::exception_ptr TlsConfig::PeerVerificationError(const void* ssl) {
    if (!ssl) {
        return nullptr;
    }
    auto* error = static_cast<std::exception_ptr*>(
        SSL_get_ex_data(static_cast<const SSL*>(ssl), VerifyErrorIndex()));
    return error ? *error : nullptr;
}

std::shared_ptr<TlsConfig> CreateTlsConfig(
    const InstanceURI& inst,
    CertificateChain chain,
    const ConnectInfo& info,
    const crypto::PrivateKey& key
) {
    auto impl = std::make_unique<TlsConfig::Impl>();
    impl->instance = inst.ToString();
    impl->server_name = info.instance_uid + SERVER_CN_SUFFIX;
    impl->root = std::move(chain.root);
    impl->client_chain.push_back(std::move(chain.client));
    impl->client_chain.push_back(std::move(chain.intermediate));

    auto fail = [&impl](const std::string& what) {
        unsigned long code = ERR_get_error();
        ERR_clear_error();
        std::string detail = what;
        if (code != 0) {
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            detail += ": ";
            detail += buf;
        }
        return DialError(detail, impl->instance);
    };

    impl->ctx.reset(SSL_CTX_new(TLS_client_method()));
    if (!impl->ctx) {
        throw fail("failed to create TLS context");
    }
    SSL_CTX* ctx = impl->ctx.get();

    if (SSL_CTX_set_min_proto_version(ctx, TLS1_3_VERSION) != 1) {
        throw fail("failed to pin minimum TLS version");
    }

    // Root CA is also installed in the store; the verify callback replaces
    // OpenSSL's own chain validation and only trusts this root.
    X509* root = static_cast<X509*>(impl->root.GetNativeHandle());
    if (X509_STORE_add_cert(SSL_CTX_get_cert_store(ctx), root) != 1) {
        throw fail("failed to install root certificate");
    }
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_cert_verify_callback(ctx, &TlsConfig::Impl::VerifyCallback, impl.get());

    X509* leaf = static_cast<X509*>(impl->client_chain[0].GetNativeHandle());
    X509* intermediate = static_cast<X509*>(impl->client_chain[1].GetNativeHandle());
    if (SSL_CTX_use_certificate(ctx, leaf) != 1) {
        throw fail("failed to install client certificate");
    }
    if (SSL_CTX_add1_chain_cert(ctx, intermediate) != 1) {
        throw fail("failed to install intermediate certificate");
    }
    if (SSL_CTX_use_PrivateKey(ctx, static_cast<EVP_PKEY*>(key.GetNativeHandle())) != 1) {
        throw fail("failed to install client private key");
    }
    if (SSL_CTX_check_private_key(ctx) != 1) {
        throw fail("client certificate does not match private key");
    }

    return std::shared_ptr<TlsConfig>(new TlsConfig(std::move(impl)));
}

} // namespace alloydbconn
