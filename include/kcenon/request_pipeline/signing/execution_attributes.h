/**
 * @file execution_attributes.h
 * @brief Well-known keys of the per-attempt execution attributes
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_EXECUTION_ATTRIBUTES_H
#define KCENON_REQUEST_PIPELINE_SIGNING_EXECUTION_ATTRIBUTES_H

#include <kcenon/request_pipeline/core/attribute_map.h>
#include <kcenon/request_pipeline/signing/auth_scheme.h>
#include <kcenon/request_pipeline/signing/identity.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::request_pipeline {

struct execution_attributes {
    /// Auth scheme chosen for the attempt
    static constexpr attribute_key<std::shared_ptr<const selected_auth_scheme>> selected_scheme{
        "SelectedAuthScheme"};

    /// Clock skew handed to legacy signers (local time minus service time)
    static constexpr attribute_key<std::chrono::seconds> time_offset{"TimeOffset"};

    /// Credentials read by legacy signers
    static constexpr attribute_key<std::shared_ptr<const aws_credentials_identity>> aws_credentials{
        "AwsCredentials"};

    static constexpr attribute_key<std::string> signing_region{"SigningRegion"};

    static constexpr attribute_key<std::string> service_signing_name{"ServiceSigningName"};
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_EXECUTION_ATTRIBUTES_H
