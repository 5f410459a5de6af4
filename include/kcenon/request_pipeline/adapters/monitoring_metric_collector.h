// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file monitoring_metric_collector.h
 * @brief metric_collector forwarding to common::interfaces::IMonitor
 *
 * Reported durations are recorded as gauges in milliseconds, named
 * "<prefix>.<metric name>" (e.g. request_pipeline.SigningDuration).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"
#include "../metrics/metric_collector.h"

#if KCENON_WITH_COMMON_SYSTEM
#include <kcenon/common/interfaces/monitoring_interface.h>
#endif

namespace kcenon::request_pipeline::adapters {

#if KCENON_WITH_COMMON_SYSTEM

/**
 * @brief Adapter that sends pipeline metrics to an IMonitor
 *
 * @note Thread-safe: report_metric() may be called from multiple threads.
 *
 * @example
 * @code
 * auto collector = monitoring_metric_collector::create(monitor);
 * context->set_metrics(collector);
 * @endcode
 */
class monitoring_metric_collector : public metric_collector {
public:
    [[nodiscard]] static std::shared_ptr<monitoring_metric_collector> create(
        std::shared_ptr<common::interfaces::IMonitor> monitor,
        const std::string& prefix = "request_pipeline");

    explicit monitoring_metric_collector(
        std::shared_ptr<common::interfaces::IMonitor> monitor,
        const std::string& prefix = "request_pipeline");

    ~monitoring_metric_collector() override;

    // Non-copyable
    monitoring_metric_collector(const monitoring_metric_collector&) = delete;
    monitoring_metric_collector& operator=(const monitoring_metric_collector&) = delete;

    void report_metric(std::string_view name, std::chrono::nanoseconds value) override;

    [[nodiscard]] std::string get_prefix() const;

    /**
     * @brief Number of values the monitor refused
     */
    [[nodiscard]] uint64_t failed_reports() const;

private:
    std::shared_ptr<common::interfaces::IMonitor> monitor_;
    std::string prefix_;
    std::atomic<uint64_t> failed_reports_{0};
};

#endif  // KCENON_WITH_COMMON_SYSTEM

}  // namespace kcenon::request_pipeline::adapters
