/**
 * @file instance.h
 * @brief AlloyDB instance identifier
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_INSTANCE_H
#define ALLOYDBCONN_INSTANCE_H

#include <string>

namespace alloydbconn {

/**
 * @brief Immutable (project, region, cluster, name) tuple
 */
class InstanceURI {
public:
    InstanceURI(std::string project, std::string region,
                std::string cluster, std::string name);

    const std::string& project() const { return project_; }
    const std::string& region() const { return region_; }
    const std::string& cluster() const { return cluster_; }
    const std::string& name() const { return name_; }

    /**
     * @brief Canonical form
     * @return "projects/<p>/locations/<r>/clusters/<c>/instances/<i>"
     */
    std::string ToString() const;

    bool operator==(const InstanceURI& other) const;
    bool operator!=(const InstanceURI& other) const { return !(*this == other); }

private:
    std::string project_;
    std::string region_;
    std::string cluster_;
    std::string name_;
};

/**
 * @brief Parse the canonical instance URI form
 *
 * Domain-scoped projects ("example.com:project") are accepted.
 *
 * @throws ConfigError if @p uri is not in canonical form
 */
InstanceURI ParseInstanceURI(const std::string& uri);

} // namespace alloydbconn

#endif // ALLOYDBCONN_INSTANCE_H
