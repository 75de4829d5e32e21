/**
 * @file config_test.cpp
 * @brief Unit tests for refresher options and the Admin API JSON codec
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "alloydbconn/common/admin_api.h"
#include "alloydbconn/common/config.h"
#include "alloydbconn/common/errors.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>

using namespace alloydbconn;
using namespace std::chrono_literals;

// ============================================================================
// RefresherOptions
// ============================================================================

TEST(RefresherOptionsTest, Defaults) {
    RefresherOptions options;

    EXPECT_EQ(options.refresh_timeout, 60s);
    EXPECT_EQ(options.refresh_interval, 30s);
    EXPECT_EQ(options.refresh_burst, 2);
    EXPECT_TRUE(options.dialer_id.empty());
}

TEST(RefresherOptionsTest, EmptyObjectKeepsDefaults) {
    auto options = LoadRefresherOptionsFromJSON("{}");

    EXPECT_EQ(options.refresh_timeout, 60s);
    EXPECT_EQ(options.refresh_burst, 2);
}

TEST(RefresherOptionsTest, AllKeys) {
    auto options = LoadRefresherOptionsFromJSON(R"({
        "refresh_timeout_ms": 5000,
        "refresh_interval_ms": 250,
        "refresh_burst": 4,
        "dialer_id": "dialer-7",
        "unrelated": true
    })");

    EXPECT_EQ(options.refresh_timeout, 5s);
    EXPECT_EQ(options.refresh_interval, 250ms);
    EXPECT_EQ(options.refresh_burst, 4);
    EXPECT_EQ(options.dialer_id, "dialer-7");
}

TEST(RefresherOptionsTest, RejectsMalformedJSON) {
    EXPECT_THROW(LoadRefresherOptionsFromJSON("{"), ConfigError);
    EXPECT_THROW(LoadRefresherOptionsFromJSON("[1, 2]"), ConfigError);
}

TEST(RefresherOptionsTest, RejectsWrongTypes) {
    EXPECT_THROW(LoadRefresherOptionsFromJSON(R"({"refresh_burst": "2"})"), ConfigError);
    EXPECT_THROW(LoadRefresherOptionsFromJSON(R"({"refresh_timeout_ms": 1.5})"), ConfigError);
    EXPECT_THROW(LoadRefresherOptionsFromJSON(R"({"dialer_id": 3})"), ConfigError);
}

TEST(RefresherOptionsTest, RejectsNonPositiveValues) {
    EXPECT_THROW(LoadRefresherOptionsFromJSON(R"({"refresh_burst": 0})"), ConfigError);
    EXPECT_THROW(LoadRefresherOptionsFromJSON(R"({"refresh_interval_ms": -1})"), ConfigError);
    EXPECT_THROW(LoadRefresherOptionsFromJSON(R"({"refresh_timeout_ms": 0})"), ConfigError);
}

TEST(RefresherOptionsTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "refresher_options.json";
    {
        std::ofstream out(path);
        out << R"({"refresh_burst": 3})";
    }

    auto options = LoadRefresherOptionsFromFile(path);
    EXPECT_EQ(options.refresh_burst, 3);
    std::remove(path.c_str());
}

TEST(RefresherOptionsTest, LoadFromMissingFile) {
    EXPECT_THROW(LoadRefresherOptionsFromFile("/nonexistent/alloydbconn.json"), ConfigError);
}

// ============================================================================
// Admin API Codec
// ============================================================================

TEST(AdminApiCodecTest, ResourcePaths) {
    EXPECT_EQ(admin_api::ConnectionInfoPath("p", "r", "c", "i"),
              "projects/p/locations/r/clusters/c/instances/i/connectionInfo");
    EXPECT_EQ(admin_api::GenerateClientCertificatePath("p", "r", "c"),
              "projects/p/locations/r/clusters/c:generateClientCertificate");
}

TEST(AdminApiCodecTest, ParseConnectionInfo) {
    auto info = admin_api::ParseConnectionInfo(R"({
        "name": "projects/p/locations/r/clusters/c/instances/i/connectionInfo",
        "ipAddress": "10.0.0.5",
        "instanceUid": "f0e1d2c3",
        "publicIpAddress": "34.1.2.3"
    })");

    EXPECT_EQ(info.ip_address(), "10.0.0.5");
    EXPECT_EQ(info.instance_uid(), "f0e1d2c3");
}

TEST(AdminApiCodecTest, ParseCertificateResponse) {
    auto resp = admin_api::ParseGenerateClientCertificateResponse(R"({
        "pemCertificate": "client",
        "pemCertificateChain": ["intermediate", "root"]
    })");

    EXPECT_EQ(resp.pem_certificate(), "client");
    ASSERT_EQ(resp.pem_certificate_chain_size(), 2);
    EXPECT_EQ(resp.pem_certificate_chain(0), "intermediate");
    EXPECT_EQ(resp.pem_certificate_chain(1), "root");
}

TEST(AdminApiCodecTest, MalformedBody) {
    try {
        admin_api::ParseConnectionInfo("<html>502 Bad Gateway</html>");
        FAIL() << "expected AdminApiError";
    } catch (const AdminApiError& e) {
        EXPECT_EQ(e.status(), 0);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("connectionInfo"));
    }
}

TEST(AdminApiCodecTest, RequestToJson) {
    proto::GenerateClientCertificateRequest request;
    request.set_parent("projects/p/locations/r/clusters/c");
    request.set_pem_csr("-----BEGIN CERTIFICATE REQUEST-----");

    auto body = nlohmann::json::parse(admin_api::RequestToJson(request));
    EXPECT_EQ(body["parent"].get<std::string>(), "projects/p/locations/r/clusters/c");
    EXPECT_EQ(body["pemCsr"].get<std::string>(), "-----BEGIN CERTIFICATE REQUEST-----");
    EXPECT_FALSE(body.contains("certDuration"));
}

TEST(AdminApiCodecTest, ErrorMessageCarriesStatus) {
    AdminApiError err(403, "permission denied");

    EXPECT_EQ(err.status(), 403);
    EXPECT_STREQ(err.what(), "admin API returned HTTP 403: permission denied");
}
