/**
 * @file in_memory_metric_collector.cpp
 * @brief Implementation of in_memory_metric_collector
 */

#include <kcenon/request_pipeline/metrics/metric_collector.h>

#include <algorithm>
#include <mutex>

namespace kcenon::request_pipeline {

struct in_memory_metric_collector::impl {
    mutable std::mutex mutex;
    std::vector<record> records;
};

in_memory_metric_collector::in_memory_metric_collector() : impl_(std::make_unique<impl>()) {}

in_memory_metric_collector::~in_memory_metric_collector() = default;

void in_memory_metric_collector::report_metric(std::string_view name,
                                               std::chrono::nanoseconds value) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->records.push_back({std::string(name), value});
}

auto in_memory_metric_collector::records() const -> std::vector<record> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->records;
}

auto in_memory_metric_collector::count(std::string_view name) const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return static_cast<std::size_t>(
        std::count_if(impl_->records.begin(), impl_->records.end(),
                      [name](const record& r) { return r.name == name; }));
}

auto in_memory_metric_collector::last(std::string_view name) const
    -> std::optional<std::chrono::nanoseconds> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto it = impl_->records.rbegin(); it != impl_->records.rend(); ++it) {
        if (it->name == name) {
            return it->value;
        }
    }
    return std::nullopt;
}

void in_memory_metric_collector::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->records.clear();
}

}  // namespace kcenon::request_pipeline
