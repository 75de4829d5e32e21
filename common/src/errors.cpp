/**
 * @file errors.cpp
 * @brief Connector error formatting
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/errors.h"

namespace alloydbconn {

namespace {

std::string FormatError(
    const std::string& kind,
    const std::string& message,
    const std::string& instance,
    std::exception_ptr cause
) {
    std::string text = kind + " error: " + message + " (connection name = \"" + instance + "\")";
    if (cause) {
        text += ": " + DescribeError(cause);
    }
    return text;
}

} // namespace

ConnectorError::ConnectorError(
    const std::string& kind,
    const std::string& message,
    const std::string& instance,
    std::exception_ptr cause
) : std::runtime_error(FormatError(kind, message, instance, cause))
  , message_(message)
  , instance_(instance)
  , cause_(cause) {}

std::string DescribeError(std::exception_ptr error) {
    if (!error) {
        return "<nil>";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
}

} // namespace alloydbconn
