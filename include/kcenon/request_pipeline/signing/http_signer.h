/**
 * @file http_signer.h
 * @brief Capability-based signer interface
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_HTTP_SIGNER_H
#define KCENON_REQUEST_PIPELINE_SIGNING_HTTP_SIGNER_H

#include <kcenon/request_pipeline/core/attribute_map.h>
#include <kcenon/request_pipeline/core/types.h>
#include <kcenon/request_pipeline/signing/sign_request.h>
#include <kcenon/request_pipeline/signing/signing_clock.h>

#include <future>
#include <memory>

namespace kcenon::request_pipeline {

/**
 * @brief Signer selected through an auth scheme
 *
 * Signers read their settings from sign_request::properties. The signing
 * stage guarantees that signing_clock_property is always present.
 */
class http_signer {
public:
    /// Clock the signature is computed against
    static constexpr attribute_key<std::shared_ptr<const signing_clock>> signing_clock_property{
        "SigningClock"};

    virtual ~http_signer() = default;

    /**
     * @brief Sign a request without a streaming body
     */
    [[nodiscard]] virtual auto sign(const sign_request& request) -> result<signed_request> = 0;

    /**
     * @brief Sign a request whose body is streamed
     *
     * The returned payload, if set, replaces the body sent on the wire.
     */
    [[nodiscard]] virtual auto sign_async(const async_sign_request& request)
        -> std::future<result<async_signed_request>> = 0;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_HTTP_SIGNER_H
