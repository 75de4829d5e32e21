/**
 * @file errors.h
 * @brief Error types reported by the refresh and dial paths
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_ERRORS_H
#define ALLOYDBCONN_ERRORS_H

#include <exception>
#include <stdexcept>
#include <string>

namespace alloydbconn {

/**
 * @brief Invalid configuration or identifier
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Error attributed to one instance, optionally wrapping a cause
 *
 * what() reads
 * `<kind> error: <message> (connection name = "<instance>")[: <cause>]`.
 */
class ConnectorError : public std::runtime_error {
public:
    ConnectorError(
        const std::string& kind,
        const std::string& message,
        const std::string& instance,
        std::exception_ptr cause
    );

    const std::string& message() const noexcept { return message_; }
    const std::string& instance() const noexcept { return instance_; }

    /// Underlying error, null if none
    std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::string message_;
    std::string instance_;
    std::exception_ptr cause_;
};

/**
 * @brief Failure to obtain fresh instance metadata or certificates
 */
class RefreshError : public ConnectorError {
public:
    RefreshError(const std::string& message, const std::string& instance,
                 std::exception_ptr cause = nullptr)
        : ConnectorError("Refresh", message, instance, cause) {}
};

/**
 * @brief Failure while establishing or verifying the TLS channel
 */
class DialError : public ConnectorError {
public:
    DialError(const std::string& message, const std::string& instance,
              std::exception_ptr cause = nullptr)
        : ConnectorError("Dial", message, instance, cause) {}
};

/**
 * @brief Render an exception_ptr as text, "<nil>" when null
 */
std::string DescribeError(std::exception_ptr error);

} // namespace alloydbconn

#endif // ALLOYDBCONN_ERRORS_H
