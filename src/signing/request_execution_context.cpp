/**
 * @file request_execution_context.cpp
 * @brief Implementation of request_execution_context
 */

#include <kcenon/request_pipeline/signing/request_execution_context.h>

#include <atomic>
#include <cstdint>
#include <mutex>

namespace kcenon::request_pipeline {

struct request_execution_context::impl {
    attribute_map attributes;

    mutable std::mutex mutex;
    std::shared_ptr<legacy_signer> signer;
    std::shared_ptr<byte_publisher> request_provider;
    interceptor_context interceptor;
    std::shared_ptr<metric_collector> metrics;

    std::atomic<int64_t> time_offset_seconds{0};
};

request_execution_context::request_execution_context() : impl_(std::make_unique<impl>()) {}

request_execution_context::~request_execution_context() = default;

auto request_execution_context::attributes() -> attribute_map& {
    return impl_->attributes;
}

auto request_execution_context::attributes() const -> const attribute_map& {
    return impl_->attributes;
}

auto request_execution_context::auth_scheme() const
    -> std::shared_ptr<const selected_auth_scheme> {
    return impl_->attributes.get_or(execution_attributes::selected_scheme,
                                    std::shared_ptr<const selected_auth_scheme>{});
}

void request_execution_context::set_auth_scheme(
    std::shared_ptr<const selected_auth_scheme> scheme) {
    if (!scheme) {
        impl_->attributes.remove(execution_attributes::selected_scheme);
        return;
    }
    impl_->attributes.put(execution_attributes::selected_scheme, std::move(scheme));
}

auto request_execution_context::signer() const -> std::shared_ptr<legacy_signer> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->signer;
}

void request_execution_context::set_signer(std::shared_ptr<legacy_signer> signer) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->signer = std::move(signer);
}

auto request_execution_context::request_provider() const -> std::shared_ptr<byte_publisher> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->request_provider;
}

void request_execution_context::set_request_provider(std::shared_ptr<byte_publisher> body) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->request_provider = std::move(body);
}

auto request_execution_context::interceptor() const -> interceptor_context {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->interceptor;
}

void request_execution_context::update_interceptor_request(http_request_ptr request) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->interceptor.request = std::move(request);
}

void request_execution_context::update_interceptor_body(std::shared_ptr<byte_publisher> body) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->interceptor.async_request_body = std::move(body);
}

auto request_execution_context::metrics() const -> std::shared_ptr<metric_collector> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->metrics;
}

void request_execution_context::set_metrics(std::shared_ptr<metric_collector> metrics) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->metrics = std::move(metrics);
}

auto request_execution_context::time_offset() const -> std::chrono::seconds {
    return std::chrono::seconds(impl_->time_offset_seconds.load());
}

void request_execution_context::update_time_offset(std::chrono::seconds offset) {
    impl_->time_offset_seconds.store(offset.count());
}

}  // namespace kcenon::request_pipeline
