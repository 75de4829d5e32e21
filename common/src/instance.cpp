/**
 * @file instance.cpp
 * @brief AlloyDB instance identifier
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/instance.h"
#include "alloydbconn/common/errors.h"
#include <sstream>
#include <utility>
#include <vector>

namespace alloydbconn {

InstanceURI::InstanceURI(std::string project, std::string region,
                         std::string cluster, std::string name)
    : project_(std::move(project))
    , region_(std::move(region))
    , cluster_(std::move(cluster))
    , name_(std::move(name)) {}

std::string InstanceURI::ToString() const {
    return "projects/" + project_ + "/locations/" + region_ +
           "/clusters/" + cluster_ + "/instances/" + name_;
}

bool InstanceURI::operator==(const InstanceURI& other) const {
    return project_ == other.project_ && region_ == other.region_ &&
           cluster_ == other.cluster_ && name_ == other.name_;
}

InstanceURI ParseInstanceURI(const std::string& uri) {
    std::vector<std::string> parts;
    std::stringstream ss(uri);
    std::string part;
    while (std::getline(ss, part, '/')) {
        parts.push_back(part);
    }
    // getline drops a trailing empty segment
    if (!uri.empty() && uri.back() == '/') {
        parts.emplace_back();
    }

    const bool shape_ok = parts.size() == 8 &&
        parts[0] == "projects" && parts[2] == "locations" &&
        parts[4] == "clusters" && parts[6] == "instances";
    if (!shape_ok) {
        throw ConfigError("invalid instance URI, expected "
                          "projects/<PROJECT>/locations/<REGION>/clusters/<CLUSTER>/instances/<INSTANCE>: " + uri);
    }

    for (size_t i = 1; i < parts.size(); i += 2) {
        if (parts[i].empty()) {
            throw ConfigError("invalid instance URI, empty " + parts[i - 1] + " component: " + uri);
        }
    }

    return InstanceURI(parts[1], parts[3], parts[5], parts[7]);
}

} // namespace alloydbconn
