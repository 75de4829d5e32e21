/**
 * @file tls_config_test.cpp
 * @brief Unit tests for TLS configuration and server certificate verification
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "alloydbconn/common/errors.h"
#include "alloydbconn/connector/tls_config.h"
#include "test_pki.h"
#include <openssl/ssl.h>
#include <memory>

using namespace alloydbconn;
using alloydbconn::test_support::Issued;
using alloydbconn::test_support::SharedClientKey;
using alloydbconn::test_support::TestPKI;
using ::testing::HasSubstr;

// ============================================================================
// Test Fixture
// ============================================================================

class TlsConfigTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        pki_ = std::make_shared<TestPKI>();
        server_ = std::make_shared<Issued>(pki_->IssueServer("uid-123.server.alloydb"));
    }

    static void TearDownTestSuite() {
        server_.reset();
        pki_.reset();
    }

    CertificateChain Chain() const {
        CertificateChain chain;
        chain.root = pki_->Root().Clone();
        chain.intermediate = pki_->Intermediate().Clone();
        chain.client = pki_->IssueFor(*SharedClientKey(), "alloydb-proxy",
                                      std::chrono::seconds(-60), std::chrono::hours(1));
        return chain;
    }

    std::shared_ptr<TlsConfig> Build(const std::string& uid = "uid-123") const {
        return CreateTlsConfig(inst_, Chain(), ConnectInfo{"10.0.0.1", uid}, *SharedClientKey());
    }

    static std::vector<std::vector<uint8_t>> Presented(const Issued& leaf) {
        return {leaf.cert.ToDER(), pki_->Intermediate().ToDER()};
    }

    static std::shared_ptr<TestPKI> pki_;
    static std::shared_ptr<Issued> server_;
    InstanceURI inst_{"p", "r", "c", "i"};
};

std::shared_ptr<TestPKI> TlsConfigTest::pki_;
std::shared_ptr<Issued> TlsConfigTest::server_;

// ============================================================================
// Construction
// ============================================================================

TEST_F(TlsConfigTest, PinsTLS13) {
    auto config = Build();

    EXPECT_EQ(config->MinProtocolVersion(), TLS1_3_VERSION);
}

TEST_F(TlsConfigTest, ExpectedServerName) {
    auto config = Build();

    EXPECT_EQ(config->ExpectedServerName(), "uid-123.server.alloydb");
}

TEST_F(TlsConfigTest, ClientChainIsLeafThenIntermediate) {
    auto config = Build();
    const auto& certs = config->ClientCertificates();

    ASSERT_EQ(certs.size(), 2u);
    EXPECT_EQ(certs[0].GetCommonName(), "alloydb-proxy");
    EXPECT_EQ(certs[1].ToDER(), pki_->Intermediate().ToDER());
    EXPECT_EQ(config->RootCertificate().ToDER(), pki_->Root().ToDER());
}

TEST_F(TlsConfigTest, PeerVerificationWithoutHostnameCheck) {
    auto config = Build();
    SSL_CTX* ctx = static_cast<SSL_CTX*>(config->GetNativeHandle());

    EXPECT_EQ(SSL_CTX_get_verify_mode(ctx), SSL_VERIFY_PEER);
    X509_VERIFY_PARAM* param = SSL_CTX_get0_param(ctx);
    EXPECT_EQ(X509_VERIFY_PARAM_get0_host(param, 0), nullptr);
}

TEST_F(TlsConfigTest, KeyMustMatchClientCertificate) {
    auto other_key = crypto::PrivateKey::GenerateRSA();

    try {
        CreateTlsConfig(inst_, Chain(), ConnectInfo{"10.0.0.1", "uid-123"}, other_key);
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_THAT(e.message(), HasSubstr("private key"));
    }
}

TEST_F(TlsConfigTest, NewSession) {
    auto config = Build();
    SSL* ssl = static_cast<SSL*>(config->NewSession());

    ASSERT_NE(ssl, nullptr);
    EXPECT_EQ(TlsConfig::PeerVerificationError(ssl), nullptr);
    SSL_free(ssl);
}

// ============================================================================
// VerifyPeerCertificate
// ============================================================================

TEST_F(TlsConfigTest, AcceptsMatchingServer) {
    auto config = Build();

    EXPECT_NO_THROW(config->VerifyPeerCertificate(Presented(*server_)));
}

TEST_F(TlsConfigTest, RejectsEmptyChain) {
    auto config = Build();

    try {
        config->VerifyPeerCertificate({});
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_EQ(e.message(), "no certificates presented");
    }
}

TEST_F(TlsConfigTest, RejectsUnparsableCertificate) {
    auto config = Build();

    try {
        config->VerifyPeerCertificate({{0x30, 0x03, 0x02, 0x01, 0x01}});
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_EQ(e.message(), "failed to parse X.509 certificate");
        EXPECT_NE(e.cause(), nullptr);
    }
}

TEST_F(TlsConfigTest, RejectsUnparsableIntermediate) {
    auto config = Build();
    auto presented = Presented(*server_);
    presented[1].resize(10);

    EXPECT_THROW(config->VerifyPeerCertificate(presented), DialError);
}

TEST_F(TlsConfigTest, RejectsWrongCommonName) {
    auto config = Build("uid-999");

    try {
        config->VerifyPeerCertificate(Presented(*server_));
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_EQ(e.message(),
                  "certificate had CN \"uid-123.server.alloydb\", expected \"uid-999.server.alloydb\"");
        EXPECT_EQ(e.cause(), nullptr);
    }
}

TEST_F(TlsConfigTest, RejectsForeignRoot) {
    auto config = Build();
    Issued foreign_root = TestPKI::CreateRootCA("Foreign Root");
    Issued foreign_ca = TestPKI::CreateIntermediateCA(foreign_root, "Foreign Intermediate");
    Issued impostor = TestPKI::IssueLeaf(foreign_ca, "uid-123.server.alloydb");

    try {
        config->VerifyPeerCertificate({impostor.cert.ToDER(), foreign_ca.cert.ToDER()});
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_EQ(e.message(), "failed to verify certificate");
        EXPECT_THROW(std::rethrow_exception(e.cause()), crypto::CryptoError);
    }
}

TEST_F(TlsConfigTest, RejectsMissingIntermediate) {
    auto config = Build();

    try {
        config->VerifyPeerCertificate({server_->cert.ToDER()});
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_EQ(e.message(), "failed to verify certificate");
    }
}

TEST_F(TlsConfigTest, RejectsExpiredServer) {
    auto config = Build();
    auto key = crypto::PrivateKey::GenerateRSA();
    auto expired = pki_->IssueFor(key, "uid-123.server.alloydb",
                                  std::chrono::hours(-2), std::chrono::hours(-1));

    EXPECT_THROW(config->VerifyPeerCertificate({expired.ToDER(), pki_->Intermediate().ToDER()}),
                 DialError);
}

TEST_F(TlsConfigTest, RejectsServerWithoutServerAuthUsage) {
    auto config = Build();
    Issued client_only = TestPKI::IssueLeaf(pki_->IntermediateIssued(), "uid-123.server.alloydb",
                                            std::chrono::hours(1), "clientAuth");

    try {
        config->VerifyPeerCertificate({client_only.cert.ToDER(), pki_->Intermediate().ToDER()});
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_EQ(e.message(), "failed to verify certificate");
        EXPECT_THROW(std::rethrow_exception(e.cause()), crypto::CryptoError);
    }
}

TEST_F(TlsConfigTest, AcceptsServerWithServerAuthOnly) {
    auto config = Build();
    Issued server_only = TestPKI::IssueLeaf(pki_->IntermediateIssued(), "uid-123.server.alloydb",
                                            std::chrono::hours(1), "serverAuth");

    EXPECT_NO_THROW(
        config->VerifyPeerCertificate({server_only.cert.ToDER(), pki_->Intermediate().ToDER()}));
}

TEST_F(TlsConfigTest, RejectsCACertificateAsServer) {
    // Chains to the root, but a CA key usage cannot authenticate a TLS server
    auto config = Build();
    auto presented = std::vector<std::vector<uint8_t>>{pki_->Intermediate().ToDER()};

    try {
        config->VerifyPeerCertificate(presented);
        FAIL() << "expected DialError";
    } catch (const DialError& e) {
        EXPECT_EQ(e.message(), "failed to verify certificate");
    }
}
