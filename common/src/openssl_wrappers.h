/**
 * @file openssl_wrappers.h
 * @brief RAII wrappers for OpenSSL resources
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_OPENSSL_WRAPPERS_H
#define ALLOYDBCONN_OPENSSL_WRAPPERS_H

#include <memory>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

namespace alloydbconn {
namespace crypto {
namespace internal {

// Custom deleters for OpenSSL types
struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* p) const { if (p) EVP_PKEY_CTX_free(p); }
};

struct BIO_Deleter {
    void operator()(BIO* p) const { if (p) BIO_free(p); }
};

struct X509_Deleter {
    void operator()(X509* p) const { if (p) X509_free(p); }
};

struct X509_REQ_Deleter {
    void operator()(X509_REQ* p) const { if (p) X509_REQ_free(p); }
};

struct X509_NAME_Deleter {
    void operator()(X509_NAME* p) const { if (p) X509_NAME_free(p); }
};

struct X509_STORE_Deleter {
    void operator()(X509_STORE* p) const { if (p) X509_STORE_free(p); }
};

struct X509_STORE_CTX_Deleter {
    void operator()(X509_STORE_CTX* p) const { if (p) X509_STORE_CTX_free(p); }
};

// Frees the stack and the certificates it holds
struct X509_STACK_Deleter {
    void operator()(STACK_OF(X509)* p) const { if (p) sk_X509_pop_free(p, X509_free); }
};

struct SSL_CTX_Deleter {
    void operator()(SSL_CTX* p) const { if (p) SSL_CTX_free(p); }
};

// RAII wrappers using unique_ptr
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using BIO_ptr = std::unique_ptr<BIO, BIO_Deleter>;
using X509_ptr = std::unique_ptr<X509, X509_Deleter>;
using X509_REQ_ptr = std::unique_ptr<X509_REQ, X509_REQ_Deleter>;
using X509_NAME_ptr = std::unique_ptr<X509_NAME, X509_NAME_Deleter>;
using X509_STORE_ptr = std::unique_ptr<X509_STORE, X509_STORE_Deleter>;
using X509_STORE_CTX_ptr = std::unique_ptr<X509_STORE_CTX, X509_STORE_CTX_Deleter>;
using X509_STACK_ptr = std::unique_ptr<STACK_OF(X509), X509_STACK_Deleter>;
using SSL_CTX_ptr = std::unique_ptr<SSL_CTX, SSL_CTX_Deleter>;

} // namespace internal
} // namespace crypto
} // namespace alloydbconn

#endif // ALLOYDBCONN_OPENSSL_WRAPPERS_H
