/**
 * @file config.h
 * @brief Refresher configuration
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_CONFIG_H
#define ALLOYDBCONN_CONFIG_H

#include <chrono>
#include <string>

namespace alloydbconn {

/**
 * @brief Tunables of one Refresher
 */
struct RefresherOptions {
    /// Upper bound for one refresh, including time spent throttled
    std::chrono::milliseconds refresh_timeout{std::chrono::seconds(60)};

    /// One refresh token is added per interval
    std::chrono::milliseconds refresh_interval{std::chrono::seconds(30)};

    /// Refreshes allowed back to back before throttling starts
    int refresh_burst = 2;

    /// Owning dialer, used to correlate traces
    std::string dialer_id;
};

/**
 * @brief Parse options from JSON
 *
 * Recognized keys: "refresh_timeout_ms", "refresh_interval_ms",
 * "refresh_burst", "dialer_id". Missing keys keep their defaults, unknown
 * keys are ignored.
 *
 * @throws ConfigError on malformed JSON, wrong types or non-positive values
 */
RefresherOptions LoadRefresherOptionsFromJSON(const std::string& json);

/**
 * @brief Read and parse an options file
 * @throws ConfigError if the file cannot be read or parsed
 */
RefresherOptions LoadRefresherOptionsFromFile(const std::string& path);

} // namespace alloydbconn

#endif // ALLOYDBCONN_CONFIG_H
