/**
 * @file request_execution_context.h
 * @brief Mutable state shared by the stages of one request attempt
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_REQUEST_EXECUTION_CONTEXT_H
#define KCENON_REQUEST_PIPELINE_SIGNING_REQUEST_EXECUTION_CONTEXT_H

#include <kcenon/request_pipeline/core/attribute_map.h>
#include <kcenon/request_pipeline/metrics/metric_collector.h>
#include <kcenon/request_pipeline/signing/auth_scheme.h>
#include <kcenon/request_pipeline/signing/execution_attributes.h>
#include <kcenon/request_pipeline/signing/http_request.h>
#include <kcenon/request_pipeline/signing/legacy_signer.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <chrono>
#include <memory>

namespace kcenon::request_pipeline {

/**
 * @brief Request and body as exposed to interceptors
 */
struct interceptor_context {
    http_request_ptr request;
    std::shared_ptr<byte_publisher> async_request_body;
};

/**
 * @brief Execution context of a single attempt
 *
 * Holds the execution attributes, the legacy signer (if any), the streaming
 * request body ("request provider"), the interceptor view of the request,
 * the metric sink and the clock offset. All accessors are thread-safe; the
 * asynchronous signing paths update the context from a worker thread.
 *
 * @code
 * auto context = std::make_shared<request_execution_context>();
 * context->set_auth_scheme(scheme);
 * context->set_request_provider(body);
 * context->set_metrics(std::make_shared<in_memory_metric_collector>());
 *
 * signing_stage stage;
 * auto signed_request = stage.execute(request, context).get();
 * @endcode
 */
class request_execution_context {
public:
    request_execution_context();
    ~request_execution_context();

    request_execution_context(const request_execution_context&) = delete;
    auto operator=(const request_execution_context&) -> request_execution_context& = delete;

    [[nodiscard]] auto attributes() -> attribute_map&;
    [[nodiscard]] auto attributes() const -> const attribute_map&;

    /**
     * @brief Selected auth scheme, stored under execution_attributes::selected_scheme
     */
    [[nodiscard]] auto auth_scheme() const -> std::shared_ptr<const selected_auth_scheme>;
    void set_auth_scheme(std::shared_ptr<const selected_auth_scheme> scheme);

    [[nodiscard]] auto signer() const -> std::shared_ptr<legacy_signer>;
    void set_signer(std::shared_ptr<legacy_signer> signer);

    /**
     * @brief Streaming body sent with the request, or nullptr
     */
    [[nodiscard]] auto request_provider() const -> std::shared_ptr<byte_publisher>;
    void set_request_provider(std::shared_ptr<byte_publisher> body);

    [[nodiscard]] auto interceptor() const -> interceptor_context;
    void update_interceptor_request(http_request_ptr request);
    void update_interceptor_body(std::shared_ptr<byte_publisher> body);

    [[nodiscard]] auto metrics() const -> std::shared_ptr<metric_collector>;
    void set_metrics(std::shared_ptr<metric_collector> metrics);

    /**
     * @brief Current clock skew (local time minus service time)
     */
    [[nodiscard]] auto time_offset() const -> std::chrono::seconds;

    /**
     * @brief Record a new clock skew, e.g. after a skew error from the service
     */
    void update_time_offset(std::chrono::seconds offset);

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_REQUEST_EXECUTION_CONTEXT_H
