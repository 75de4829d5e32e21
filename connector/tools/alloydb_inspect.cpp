/**
 * @file alloydb_inspect.cpp
 * @brief Inspect an ephemeral certificate response and check server chains
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/admin_api.h"
#include "alloydbconn/common/crypto.h"
#include "alloydbconn/common/errors.h"
#include "alloydbconn/common/instance.h"
#include "alloydbconn/connector/fetch.h"
#include "alloydbconn/connector/tls_config.h"
#include <glog/logging.h>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

const char* PLACEHOLDER_INSTANCE = "projects/-/locations/-/clusters/-/instances/-";

void PrintUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Validate a generateClientCertificate response and show its certificates.\n"
              << "\n"
              << "Required Options:\n"
              << "  --response FILE        generateClientCertificate response body (JSON)\n"
              << "\n"
              << "Optional:\n"
              << "  --instance URI         Instance the response belongs to\n"
              << "                         (projects/P/locations/R/clusters/C/instances/I)\n"
              << "  --instance-uid UID     Instance UID; the server leaf must carry\n"
              << "                         CN=<UID>.server.alloydb\n"
              << "  --server-chain FILE    Server certificate chain to verify (PEM, leaf first)\n"
              << "  --key FILE             Private key the client certificate was issued for\n"
              << "                         (required with --server-chain)\n"
              << "  --help                 Show this help message\n"
              << "\n"
              << "Example:\n"
              << "  " << program_name << " \\\n"
              << "    --response cert_response.json \\\n"
              << "    --instance-uid 3f2c9a1e \\\n"
              << "    --server-chain server.pem \\\n"
              << "    --key client.key\n"
              << std::endl;
}

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string FormatTime(int64_t epoch) {
    time_t t = static_cast<time_t>(epoch);
    struct tm tm_time = {};
    gmtime_r(&t, &tm_time);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm_time);
    return buf;
}

void PrintCertificate(const char* label, const alloydbconn::crypto::Certificate& cert) {
    std::cout << label << ":\n";
    std::cout << "  Subject:    " << cert.GetSubject() << "\n";
    std::cout << "  Issuer:     " << cert.GetIssuer() << "\n";
    std::cout << "  Serial:     " << cert.GetSerialNumber() << "\n";
    std::cout << "  Not Before: " << FormatTime(cert.GetNotBefore()) << "\n";
    std::cout << "  Not After:  " << FormatTime(cert.GetNotAfter()) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    std::string response_file;
    std::string instance_uri = PLACEHOLDER_INSTANCE;
    std::string instance_uid;
    std::string server_chain_file;
    std::string key_file;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--response") == 0 && i + 1 < argc) {
            response_file = argv[++i];
        } else if (strcmp(argv[i], "--instance") == 0 && i + 1 < argc) {
            instance_uri = argv[++i];
        } else if (strcmp(argv[i], "--instance-uid") == 0 && i + 1 < argc) {
            instance_uid = argv[++i];
        } else if (strcmp(argv[i], "--server-chain") == 0 && i + 1 < argc) {
            server_chain_file = argv[++i];
        } else if (strcmp(argv[i], "--key") == 0 && i + 1 < argc) {
            key_file = argv[++i];
        } else {
            LOG(ERROR) << "Unknown argument: " << argv[i];
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (response_file.empty()) {
        LOG(ERROR) << "Missing required argument --response";
        PrintUsage(argv[0]);
        return 1;
    }
    if (!server_chain_file.empty() && key_file.empty()) {
        LOG(ERROR) << "--server-chain requires --key";
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        alloydbconn::InstanceURI inst = alloydbconn::ParseInstanceURI(instance_uri);

        LOG(INFO) << "Loading certificate response from: " << response_file;
        auto response = alloydbconn::admin_api::ParseGenerateClientCertificateResponse(
            ReadFile(response_file));

        alloydbconn::CertificateChain chain = alloydbconn::ParseCertificateChain(inst, response);
        LOG(INFO) << "Response holds a complete certificate chain";

        std::cout << "\n=== Ephemeral Certificate Chain ===\n\n";
        PrintCertificate("Client", chain.client);
        PrintCertificate("Intermediate", chain.intermediate);
        PrintCertificate("Root", chain.root);

        try {
            std::vector<alloydbconn::crypto::Certificate> intermediates;
            intermediates.push_back(chain.intermediate.Clone());
            chain.client.VerifyChainWithIntermediates(
                intermediates, chain.root, time(nullptr),
                alloydbconn::crypto::CertificatePurpose::ClientAuth);
            std::cout << "\nClient chain: valid\n";
        } catch (const alloydbconn::crypto::CryptoError& e) {
            std::cout << "\nClient chain: INVALID (" << e.what() << ")\n";
        }

        if (server_chain_file.empty()) {
            return 0;
        }

        if (instance_uid.empty()) {
            LOG(WARNING) << "No --instance-uid given; expecting CN \".server.alloydb\"";
        }

        auto key = alloydbconn::crypto::PrivateKey::LoadFromPEM(ReadFile(key_file));
        alloydbconn::ConnectInfo info{"", instance_uid};
        auto config = alloydbconn::CreateTlsConfig(inst, std::move(chain), info, key);

        LOG(INFO) << "Loading server chain from: " << server_chain_file;
        auto server_chain = alloydbconn::crypto::Certificate::LoadChainFromPEM(
            ReadFile(server_chain_file));
        std::vector<std::vector<uint8_t>> raw_certs;
        for (const auto& cert : server_chain) {
            raw_certs.push_back(cert.ToDER());
        }

        std::cout << "\n=== Server Chain ===\n\n";
        PrintCertificate("Server", server_chain.front());
        std::cout << "  Expected CN: " << config->ExpectedServerName() << "\n";

        try {
            config->VerifyPeerCertificate(raw_certs);
        } catch (const alloydbconn::DialError& e) {
            std::cout << "\nServer chain: REJECTED\n  " << e.what() << "\n";
            return 1;
        }
        std::cout << "\nServer chain: accepted\n";
        return 0;

    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }
}
