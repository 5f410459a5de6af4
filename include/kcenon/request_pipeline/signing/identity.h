/**
 * @file identity.h
 * @brief Identities presented to signers
 *
 * Identities are resolved outside the pipeline; signers only read them.
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_IDENTITY_H
#define KCENON_REQUEST_PIPELINE_SIGNING_IDENTITY_H

#include <chrono>
#include <optional>
#include <string>

namespace kcenon::request_pipeline {

/**
 * @brief Base identity structure
 */
struct signing_identity {
    /// Identity expiration time (for temporary credentials)
    std::optional<std::chrono::system_clock::time_point> expiration;

    virtual ~signing_identity() = default;

    /**
     * @brief Check if the identity has expired
     * @return true if expired, false otherwise
     */
    [[nodiscard]] auto is_expired() const -> bool {
        if (!expiration.has_value()) {
            return false;
        }
        return std::chrono::system_clock::now() >= expiration.value();
    }
};

/**
 * @brief AWS access key identity
 */
struct aws_credentials_identity : signing_identity {
    /// Access key ID
    std::string access_key_id;

    /// Secret access key
    std::string secret_access_key;

    /// Optional session token (for temporary credentials)
    std::optional<std::string> session_token;

    aws_credentials_identity() = default;

    aws_credentials_identity(std::string access_key, std::string secret_key,
                             std::optional<std::string> token = std::nullopt)
        : access_key_id(std::move(access_key)),
          secret_access_key(std::move(secret_key)),
          session_token(std::move(token)) {}
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_IDENTITY_H
