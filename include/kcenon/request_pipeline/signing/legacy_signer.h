/**
 * @file legacy_signer.h
 * @brief Signers configured through execution attributes
 *
 * Legacy signers predate auth schemes. They take their identity, region and
 * clock offset from the execution attributes of the attempt.
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_LEGACY_SIGNER_H
#define KCENON_REQUEST_PIPELINE_SIGNING_LEGACY_SIGNER_H

#include <kcenon/request_pipeline/core/attribute_map.h>
#include <kcenon/request_pipeline/core/types.h>
#include <kcenon/request_pipeline/signing/http_request.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <future>
#include <memory>

namespace kcenon::request_pipeline {

/**
 * @brief Synchronous legacy signer
 */
class legacy_signer {
public:
    virtual ~legacy_signer() = default;

    [[nodiscard]] virtual auto sign(http_request_ptr request, attribute_map& attributes)
        -> result<http_request_ptr> = 0;
};

/**
 * @brief Legacy signer that can also sign a streaming body
 *
 * The headers are signed first through legacy_signer::sign(); the body is
 * then wrapped by sign_async_request_body() using the signed request.
 */
class async_request_body_signer : public virtual legacy_signer {
public:
    [[nodiscard]] virtual auto sign_async_request_body(http_request_ptr signed_request,
                                                       std::shared_ptr<byte_publisher> body,
                                                       attribute_map& attributes)
        -> std::shared_ptr<byte_publisher> = 0;
};

/**
 * @brief Legacy signer whose signature depends on the payload
 */
class async_signer : public virtual legacy_signer {
public:
    [[nodiscard]] virtual auto sign(http_request_ptr request,
                                    std::shared_ptr<byte_publisher> payload,
                                    attribute_map& attributes)
        -> std::future<result<http_request_ptr>> = 0;

    using legacy_signer::sign;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_LEGACY_SIGNER_H
