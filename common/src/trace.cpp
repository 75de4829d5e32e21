/**
 * @file trace.cpp
 * @brief glog-backed and no-op tracers
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/trace.h"
#include "alloydbconn/common/errors.h"
#include <glog/logging.h>
#include <chrono>

namespace alloydbconn {
namespace trace {

namespace {

std::string FormatAttributes(const Attributes& attributes) {
    std::string out;
    for (const auto& [key, value] : attributes) {
        if (!out.empty()) {
            out += ", ";
        }
        out += key + "=" + value;
    }
    return out;
}

class LoggingTracer : public Tracer {
public:
    EndSpanFunc StartSpan(const std::string& name, const Attributes& attributes) override {
        auto start = std::chrono::steady_clock::now();
        std::string attrs = FormatAttributes(attributes);
        VLOG(2) << "span start: " << name << " {" << attrs << "}";

        return [name, attrs, start](std::exception_ptr error) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (error) {
                LOG(WARNING) << "span " << name << " {" << attrs << "} failed after "
                             << elapsed.count() << "ms: " << DescribeError(error);
            } else {
                VLOG(1) << "span " << name << " {" << attrs << "} finished in "
                        << elapsed.count() << "ms";
            }
        };
    }

    void RecordRefreshResult(
        const std::string& instance,
        const std::string& dialer_id,
        std::exception_ptr error
    ) override {
        if (error) {
            LOG(WARNING) << "[" << instance << "] refresh failed (dialer " << dialer_id
                         << "): " << DescribeError(error);
        } else {
            LOG(INFO) << "[" << instance << "] refresh succeeded (dialer " << dialer_id << ")";
        }
    }
};

class NoopTracer : public Tracer {
public:
    EndSpanFunc StartSpan(const std::string&, const Attributes&) override {
        return [](std::exception_ptr) {};
    }

    void RecordRefreshResult(const std::string&, const std::string&, std::exception_ptr) override {}
};

} // namespace

std::shared_ptr<Tracer> CreateLoggingTracer() {
    return std::make_shared<LoggingTracer>();
}

std::shared_ptr<Tracer> CreateNoopTracer() {
    return std::make_shared<NoopTracer>();
}

} // namespace trace
} // namespace alloydbconn
