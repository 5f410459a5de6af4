/**
 * @file sign_request.h
 * @brief Inputs and outputs of an http_signer invocation
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_SIGN_REQUEST_H
#define KCENON_REQUEST_PIPELINE_SIGNING_SIGN_REQUEST_H

#include <kcenon/request_pipeline/core/attribute_map.h>
#include <kcenon/request_pipeline/signing/http_request.h>
#include <kcenon/request_pipeline/signing/identity.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <memory>
#include <optional>

namespace kcenon::request_pipeline {

/**
 * @brief Request to sign synchronously
 */
struct sign_request {
    /// Identity to sign with
    std::shared_ptr<const signing_identity> identity;

    /// Request to sign
    http_request_ptr request;

    /// Signer properties, including the signing clock
    attribute_map properties;

    template <typename T>
    [[nodiscard]] auto property(const attribute_key<T>& key) const -> std::optional<T> {
        return properties.get(key);
    }
};

/**
 * @brief Request to sign together with a streaming payload
 */
struct async_sign_request : sign_request {
    /// Body to be sent with the request, if any
    std::shared_ptr<byte_publisher> payload;
};

/**
 * @brief Result of a synchronous signature
 */
struct signed_request {
    http_request_ptr request;
};

/**
 * @brief Result of an asynchronous signature
 */
struct async_signed_request {
    http_request_ptr request;

    /// Replacement body (e.g. a signed chunk stream); empty keeps the original
    std::shared_ptr<byte_publisher> payload;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_SIGN_REQUEST_H
