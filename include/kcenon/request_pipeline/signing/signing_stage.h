/**
 * @file signing_stage.h
 * @brief Pipeline stage that signs an outgoing request
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_STAGE_H
#define KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_STAGE_H

#include <kcenon/request_pipeline/core/types.h>
#include <kcenon/request_pipeline/signing/http_request.h>
#include <kcenon/request_pipeline/signing/request_execution_context.h>
#include <kcenon/request_pipeline/signing/signing_strategy.h>

#include <future>
#include <memory>

namespace kcenon::request_pipeline {

/**
 * @brief Signs a request with whatever signer the context provides
 *
 * The stage resolves a signing_strategy once per call and dispatches on it:
 *
 * - capability_sync / capability_async: the selected auth scheme's
 *   http_signer is called with the scheme's signer properties. If those
 *   properties carry no signing clock, an offset_signing_clock built from
 *   the context's time offset is injected; a caller-supplied clock is
 *   passed through untouched.
 * - legacy_sync / legacy_async: the legacy signer is called with the
 *   execution attributes, after execution_attributes::time_offset has been
 *   set from the context.
 * - no_op: the request is returned as is.
 *
 * The interceptor context sees the request before signing and the signed
 * request afterwards. A replacement body returned by a capability signer
 * becomes both the request provider and the interceptor body; a body
 * returned by an async_request_body_signer replaces the request provider
 * only. Every successful signer call reports metric_names::signing_duration.
 *
 * Synchronous strategies complete before execute() returns; asynchronous
 * strategies run on a std::async worker. Either way an exception thrown by
 * the signer is rethrown from the returned future's get(), and signer
 * errors are returned unchanged.
 */
class signing_stage {
public:
    signing_stage() = default;

    [[nodiscard]] auto execute(http_request_ptr request,
                               std::shared_ptr<request_execution_context> context)
        -> std::future<result<http_request_ptr>>;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_STAGE_H
