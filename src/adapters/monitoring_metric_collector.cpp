// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include <kcenon/request_pipeline/adapters/monitoring_metric_collector.h>
#include <kcenon/request_pipeline/core/logging.h>

namespace kcenon::request_pipeline::adapters {

#if KCENON_WITH_COMMON_SYSTEM

std::shared_ptr<monitoring_metric_collector> monitoring_metric_collector::create(
    std::shared_ptr<common::interfaces::IMonitor> monitor,
    const std::string& prefix) {
    return std::make_shared<monitoring_metric_collector>(std::move(monitor), prefix);
}

monitoring_metric_collector::monitoring_metric_collector(
    std::shared_ptr<common::interfaces::IMonitor> monitor,
    const std::string& prefix)
    : monitor_(std::move(monitor))
    , prefix_(prefix) {}

monitoring_metric_collector::~monitoring_metric_collector() = default;

void monitoring_metric_collector::report_metric(std::string_view name,
                                                std::chrono::nanoseconds value) {
    if (!monitor_) {
        return;
    }

    const auto millis = std::chrono::duration<double, std::milli>(value).count();
    auto result = monitor_->record_metric(
        prefix_ + "." + std::string(name), millis, {{"unit", "ms"}});
    if (result.is_err()) {
        failed_reports_.fetch_add(1);
        RP_LOG_WARN(log_category::signing,
            "Failed to record metric " + std::string(name) + ": " + result.error().message);
    }
}

std::string monitoring_metric_collector::get_prefix() const {
    return prefix_;
}

uint64_t monitoring_metric_collector::failed_reports() const {
    return failed_reports_.load();
}

#endif  // KCENON_WITH_COMMON_SYSTEM

}  // namespace kcenon::request_pipeline::adapters
