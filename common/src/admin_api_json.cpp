/**
 * @file admin_api_json.cpp
 * @brief REST JSON codec for Admin API messages (protobuf json_util)
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/admin_api.h"
#include "alloydb_admin.pb.h"
#include <google/protobuf/util/json_util.h>

namespace alloydbconn {

AdminApiError::AdminApiError(int status, const std::string& message)
    : std::runtime_error(status > 0
          ? "admin API returned HTTP " + std::to_string(status) + ": " + message
          : "admin API request failed: " + message)
    , status_(status) {}

namespace admin_api {

namespace {

std::string ClusterPath(const std::string& project, const std::string& region,
                        const std::string& cluster) {
    return "projects/" + project + "/locations/" + region + "/clusters/" + cluster;
}

template <typename Message>
Message ParseMessage(const std::string& json, const char* what) {
    Message message;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
    if (!status.ok()) {
        throw AdminApiError(0, std::string("failed to decode ") + what + ": " +
                               std::string(status.message()));
    }
    return message;
}

} // namespace

std::string ConnectionInfoPath(const std::string& project, const std::string& region,
                               const std::string& cluster, const std::string& name) {
    return ClusterPath(project, region, cluster) + "/instances/" + name + "/connectionInfo";
}

std::string GenerateClientCertificatePath(const std::string& project, const std::string& region,
                                          const std::string& cluster) {
    return ClusterPath(project, region, cluster) + ":generateClientCertificate";
}

std::string RequestToJson(const proto::GenerateClientCertificateRequest& request) {
    std::string json_string;
    google::protobuf::util::JsonPrintOptions options;

    auto status = google::protobuf::util::MessageToJsonString(request, &json_string, options);
    if (!status.ok()) {
        throw AdminApiError(0, "failed to encode request: " + std::string(status.message()));
    }
    return json_string;
}

proto::ConnectionInfo ParseConnectionInfo(const std::string& json) {
    return ParseMessage<proto::ConnectionInfo>(json, "connectionInfo response");
}

proto::GenerateClientCertificateResponse ParseGenerateClientCertificateResponse(const std::string& json) {
    return ParseMessage<proto::GenerateClientCertificateResponse>(
        json, "generateClientCertificate response");
}

} // namespace admin_api
} // namespace alloydbconn
