/**
 * @file signing_strategy.h
 * @brief Resolution of how a request attempt is signed
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_STRATEGY_H
#define KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_STRATEGY_H

#include <kcenon/request_pipeline/signing/auth_scheme.h>
#include <kcenon/request_pipeline/signing/legacy_signer.h>
#include <kcenon/request_pipeline/signing/request_execution_context.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <memory>
#include <string_view>
#include <variant>

namespace kcenon::request_pipeline {

/// Auth scheme signer, no streaming body
struct capability_sync {
    std::shared_ptr<const selected_auth_scheme> scheme;
};

/// Auth scheme signer with a streaming body
struct capability_async {
    std::shared_ptr<const selected_auth_scheme> scheme;
    std::shared_ptr<byte_publisher> payload;
};

/// Legacy signer signing headers only
struct legacy_sync {
    std::shared_ptr<legacy_signer> signer;
};

/**
 * @brief Legacy signer that also consumes the body
 *
 * Exactly one of body_signer and payload_signer is set. body_signer is
 * chosen when the signer can sign a request body and a body is present.
 */
struct legacy_async {
    std::shared_ptr<async_request_body_signer> body_signer;
    std::shared_ptr<async_signer> payload_signer;
    std::shared_ptr<byte_publisher> payload;
};

/// Nothing to sign with
struct no_op {};

using signing_strategy =
    std::variant<capability_sync, capability_async, legacy_sync, legacy_async, no_op>;

/**
 * @brief Pick the signing strategy for the current state of @p context
 *
 * A selected auth scheme with a signer takes precedence over a legacy
 * signer. The choice between sync and async variants depends on whether
 * the context carries a request provider.
 */
[[nodiscard]] auto resolve_signing_strategy(const request_execution_context& context)
    -> signing_strategy;

[[nodiscard]] auto strategy_name(const signing_strategy& strategy) -> std::string_view;

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_STRATEGY_H
