/**
 * @file config_json.cpp
 * @brief Refresher configuration loading (nlohmann::json)
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/config.h"
#include "alloydbconn/common/errors.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <limits>

using json = nlohmann::json;

namespace alloydbconn {

namespace {

int64_t PositiveInteger(const json& j, const char* key) {
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw ConfigError(std::string("config key '") + key + "' must be an integer");
    }
    int64_t n = value.get<int64_t>();
    if (n <= 0) {
        throw ConfigError(std::string("config key '") + key + "' must be positive, got " +
                          std::to_string(n));
    }
    return n;
}

} // namespace

RefresherOptions LoadRefresherOptionsFromJSON(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid refresher config: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("invalid refresher config: top-level value must be an object");
    }

    RefresherOptions options;
    if (j.contains("refresh_timeout_ms")) {
        options.refresh_timeout = std::chrono::milliseconds(PositiveInteger(j, "refresh_timeout_ms"));
    }
    if (j.contains("refresh_interval_ms")) {
        options.refresh_interval = std::chrono::milliseconds(PositiveInteger(j, "refresh_interval_ms"));
    }
    if (j.contains("refresh_burst")) {
        int64_t burst = PositiveInteger(j, "refresh_burst");
        if (burst > std::numeric_limits<int>::max()) {
            throw ConfigError("config key 'refresh_burst' is out of range");
        }
        options.refresh_burst = static_cast<int>(burst);
    }
    if (j.contains("dialer_id")) {
        if (!j["dialer_id"].is_string()) {
            throw ConfigError("config key 'dialer_id' must be a string");
        }
        options.dialer_id = j["dialer_id"].get<std::string>();
    }
    return options;
}

RefresherOptions LoadRefresherOptionsFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Failed to open config file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    return LoadRefresherOptionsFromJSON(text);
}

} // namespace alloydbconn
