/**
 * @file signing_stage.cpp
 * @brief Implementation of signing_stage
 */

#include <kcenon/request_pipeline/signing/signing_stage.h>
#include <kcenon/request_pipeline/core/logging.h>
#include <kcenon/request_pipeline/metrics/metric_collector.h>
#include <kcenon/request_pipeline/signing/execution_attributes.h>
#include <kcenon/request_pipeline/signing/http_signer.h>
#include <kcenon/request_pipeline/signing/sign_request.h>
#include <kcenon/request_pipeline/signing/signing_clock.h>

#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <variant>

namespace kcenon::request_pipeline {

namespace {

using steady = std::chrono::steady_clock;

template <typename T>
auto ready_future(T value) -> std::future<T> {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

// Runs a signer on the calling thread; a throwing signer fails the future
template <typename Fn>
auto run_inline(Fn&& fn) -> std::future<result<http_request_ptr>> {
    std::promise<result<http_request_ptr>> promise;
    try {
        promise.set_value(fn());
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

auto signer_properties(const selected_auth_scheme& scheme,
                       const request_execution_context& context) -> attribute_map {
    attribute_map properties = scheme.option.signer_properties;
    properties.put_if_absent(
        http_signer::signing_clock_property,
        std::shared_ptr<const signing_clock>(
            std::make_shared<offset_signing_clock>(context.time_offset())));
    return properties;
}

void record_success(const request_execution_context& context,
                    std::string_view strategy,
                    const selected_auth_scheme* scheme,
                    steady::duration elapsed) {
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
    if (auto metrics = context.metrics()) {
        metrics->report_metric(metric_names::signing_duration, duration);
    }

    pipeline_log_context log_ctx;
    log_ctx.strategy = std::string(strategy);
    if (scheme) {
        log_ctx.scheme_id = scheme->option.scheme_id;
    }
    log_ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    RP_LOG_DEBUG_CTX(log_category::signing, "Request signed", log_ctx);
}

void record_failure(std::string_view strategy, const error& err) {
    pipeline_log_context log_ctx;
    log_ctx.strategy = std::string(strategy);
    log_ctx.error_message = err.message;
    RP_LOG_ERROR_CTX(log_category::signing, "Signing failed", log_ctx);
}

auto sign_capability_sync(const http_request_ptr& request,
                          const capability_sync& strategy,
                          request_execution_context& context) -> result<http_request_ptr> {
    const auto& scheme = *strategy.scheme;

    sign_request to_sign;
    to_sign.identity = scheme.identity;
    to_sign.request = request;
    to_sign.properties = signer_properties(scheme, context);

    auto started = steady::now();
    auto signed_request = scheme.signer->sign(to_sign);
    auto elapsed = steady::now() - started;

    if (!signed_request) {
        record_failure("capability_sync", signed_request.error());
        return unexpected(signed_request.error());
    }
    record_success(context, "capability_sync", &scheme, elapsed);

    context.update_interceptor_request(signed_request.value().request);
    return signed_request.value().request;
}

auto sign_capability_async(const http_request_ptr& request,
                           const capability_async& strategy,
                           request_execution_context& context) -> result<http_request_ptr> {
    const auto& scheme = *strategy.scheme;

    async_sign_request to_sign;
    to_sign.identity = scheme.identity;
    to_sign.request = request;
    to_sign.properties = signer_properties(scheme, context);
    to_sign.payload = strategy.payload;

    auto started = steady::now();
    auto signed_request = scheme.signer->sign_async(to_sign).get();
    auto elapsed = steady::now() - started;

    if (!signed_request) {
        record_failure("capability_async", signed_request.error());
        return unexpected(signed_request.error());
    }
    record_success(context, "capability_async", &scheme, elapsed);

    if (auto payload = signed_request.value().payload) {
        context.set_request_provider(payload);
        context.update_interceptor_body(std::move(payload));
    }
    context.update_interceptor_request(signed_request.value().request);
    return signed_request.value().request;
}

auto sign_legacy_sync(const http_request_ptr& request,
                      const legacy_sync& strategy,
                      request_execution_context& context) -> result<http_request_ptr> {
    auto& attributes = context.attributes();
    attributes.put(execution_attributes::time_offset, context.time_offset());

    auto started = steady::now();
    auto signed_request = strategy.signer->sign(request, attributes);
    auto elapsed = steady::now() - started;

    if (!signed_request) {
        record_failure("legacy_sync", signed_request.error());
        return unexpected(signed_request.error());
    }
    record_success(context, "legacy_sync", nullptr, elapsed);

    context.update_interceptor_request(signed_request.value());
    return signed_request.value();
}

auto sign_legacy_body(const http_request_ptr& request,
                      const legacy_async& strategy,
                      request_execution_context& context) -> result<http_request_ptr> {
    auto& attributes = context.attributes();
    attributes.put(execution_attributes::time_offset, context.time_offset());

    auto started = steady::now();
    auto signed_request = strategy.body_signer->sign(request, attributes);
    auto elapsed = steady::now() - started;

    if (!signed_request) {
        record_failure("legacy_async", signed_request.error());
        return unexpected(signed_request.error());
    }
    record_success(context, "legacy_async", nullptr, elapsed);

    auto signed_body = strategy.body_signer->sign_async_request_body(
        signed_request.value(), strategy.payload, attributes);
    if (signed_body) {
        context.set_request_provider(std::move(signed_body));
    }

    context.update_interceptor_request(signed_request.value());
    return signed_request.value();
}

auto sign_legacy_payload(const http_request_ptr& request,
                         const legacy_async& strategy,
                         request_execution_context& context) -> result<http_request_ptr> {
    auto& attributes = context.attributes();
    attributes.put(execution_attributes::time_offset, context.time_offset());

    auto started = steady::now();
    auto signed_request = strategy.payload_signer->sign(request, strategy.payload, attributes).get();
    auto elapsed = steady::now() - started;

    if (!signed_request) {
        record_failure("legacy_async", signed_request.error());
        return unexpected(signed_request.error());
    }
    record_success(context, "legacy_async", nullptr, elapsed);

    context.update_interceptor_request(signed_request.value());
    return signed_request.value();
}

struct dispatch {
    http_request_ptr request;
    std::shared_ptr<request_execution_context> context;

    auto operator()(const capability_sync& strategy) const
        -> std::future<result<http_request_ptr>> {
        return run_inline([&]() { return sign_capability_sync(request, strategy, *context); });
    }

    auto operator()(const capability_async& strategy) const
        -> std::future<result<http_request_ptr>> {
        return std::async(std::launch::async, [request = request, context = context, strategy]() {
            return sign_capability_async(request, strategy, *context);
        });
    }

    auto operator()(const legacy_sync& strategy) const
        -> std::future<result<http_request_ptr>> {
        return run_inline([&]() { return sign_legacy_sync(request, strategy, *context); });
    }

    auto operator()(const legacy_async& strategy) const
        -> std::future<result<http_request_ptr>> {
        if (strategy.body_signer) {
            return run_inline([&]() { return sign_legacy_body(request, strategy, *context); });
        }
        return std::async(std::launch::async, [request = request, context = context, strategy]() {
            return sign_legacy_payload(request, strategy, *context);
        });
    }

    auto operator()(const no_op&) const -> std::future<result<http_request_ptr>> {
        RP_LOG_TRACE(log_category::signing, "No signer configured, request left unsigned");
        return ready_future(result<http_request_ptr>(request));
    }
};

}  // namespace

auto signing_stage::execute(http_request_ptr request,
                            std::shared_ptr<request_execution_context> context)
    -> std::future<result<http_request_ptr>> {
    if (!context) {
        return ready_future(result<http_request_ptr>(
            unexpected(error{error_code::invalid_configuration, "execution context is required"})));
    }

    context->update_interceptor_request(request);

    auto strategy = resolve_signing_strategy(*context);
    RP_LOG_TRACE(log_category::signing,
                 "Signing with strategy " + std::string(strategy_name(strategy)));

    return std::visit(dispatch{std::move(request), std::move(context)}, strategy);
}

}  // namespace kcenon::request_pipeline
