/**
 * @file auth_scheme.h
 * @brief Auth scheme resolved for a request attempt
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_AUTH_SCHEME_H
#define KCENON_REQUEST_PIPELINE_SIGNING_AUTH_SCHEME_H

#include <kcenon/request_pipeline/core/attribute_map.h>
#include <kcenon/request_pipeline/signing/http_signer.h>
#include <kcenon/request_pipeline/signing/identity.h>

#include <memory>
#include <string>

namespace kcenon::request_pipeline {

/**
 * @brief Scheme identifier plus the properties handed to its signer
 */
struct auth_scheme_option {
    /// Scheme identifier, e.g. "aws.auth#sigv4"
    std::string scheme_id;

    attribute_map signer_properties;
};

/**
 * @brief Identity, signer and option chosen for one attempt
 */
struct selected_auth_scheme {
    std::shared_ptr<const signing_identity> identity;
    std::shared_ptr<http_signer> signer;
    auth_scheme_option option;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_AUTH_SCHEME_H
