/**
 * @file aws_v4_signing.h
 * @brief AWS Signature Version 4 building blocks
 *
 * Canonical request, string to sign, signing key derivation and the
 * chained chunk signatures of the aws-chunked body encoding. The signers
 * in aws_v4_signer.h are assembled from these functions.
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_AWS_V4_SIGNING_H
#define KCENON_REQUEST_PIPELINE_SIGNING_AWS_V4_SIGNING_H

#include <kcenon/request_pipeline/signing/http_request.h>
#include <kcenon/request_pipeline/signing/identity.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::request_pipeline::aws_v4 {

inline constexpr std::string_view algorithm = "AWS4-HMAC-SHA256";
inline constexpr std::string_view chunk_algorithm = "AWS4-HMAC-SHA256-PAYLOAD";

/// x-amz-content-sha256 value announcing a signed aws-chunked body
inline constexpr std::string_view streaming_payload = "STREAMING-AWS4-HMAC-SHA256-PAYLOAD";

inline constexpr std::string_view unsigned_payload = "UNSIGNED-PAYLOAD";

/// SHA-256 of the empty string
inline constexpr std::string_view empty_payload_hash =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

inline constexpr std::string_view chunk_signature_name = "chunk-signature";

/// Length of ";chunk-signature=" followed by 64 hex digits
inline constexpr uint64_t chunk_signature_extension_length = 1 + 15 + 1 + 64;

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Format as YYYYMMDD'T'HHMMSS'Z' (UTC)
 */
auto format_amz_date(std::chrono::system_clock::time_point instant) -> std::string;

/**
 * @brief Format as YYYYMMDD (UTC)
 */
auto format_date_stamp(std::chrono::system_clock::time_point instant) -> std::string;

// ============================================================================
// Request Signature
// ============================================================================

auto credential_scope(std::string_view date_stamp,
                      std::string_view region,
                      std::string_view service) -> std::string;

/**
 * @brief Encoded query string with parameters sorted by name, then value
 */
auto canonical_query_string(const std::vector<std::pair<std::string, std::string>>& params)
    -> std::string;

/**
 * @brief Canonical request text and the list of headers it covers
 */
struct canonical_request {
    std::string text;
    std::string signed_headers;
};

/**
 * @brief Build the canonical request of @p request
 *
 * Every header is signed except hop-by-hop and tracing headers
 * (connection, expect, transfer-encoding, user-agent, x-amzn-trace-id).
 * The path is taken as already encoded.
 */
auto build_canonical_request(const http_request& request, std::string_view payload_hash)
    -> canonical_request;

auto build_string_to_sign(std::string_view amz_date,
                          std::string_view scope,
                          std::string_view canonical_request_text) -> std::string;

/**
 * @brief kSigning = HMAC(HMAC(HMAC(HMAC("AWS4" + secret, date), region), service), "aws4_request")
 */
auto derive_signing_key(std::string_view secret_access_key,
                        std::string_view date_stamp,
                        std::string_view region,
                        std::string_view service) -> std::vector<uint8_t>;

/**
 * @brief Lowercase hex HMAC-SHA256 of @p string_to_sign
 */
auto compute_signature(std::span<const uint8_t> signing_key, std::string_view string_to_sign)
    -> std::string;

/**
 * @brief Output of sign_headers()
 */
struct header_signature {
    /// Request with Host, X-Amz-Date, token and Authorization headers added
    http_request request;

    std::string signature;
    std::string amz_date;
    std::string scope;
    std::vector<uint8_t> signing_key;
};

/**
 * @brief Add the SigV4 authentication headers to a copy of @p request
 * @param payload_hash Value standing for the body in the canonical request
 */
auto sign_headers(const http_request& request,
                  const aws_credentials_identity& credentials,
                  std::string_view region,
                  std::string_view service,
                  std::chrono::system_clock::time_point signing_time,
                  std::string_view payload_hash) -> header_signature;

// ============================================================================
// Chunk Signatures
// ============================================================================

/**
 * @brief String to sign for one chunk of an aws-chunked body
 * @param previous_signature Seed signature for the first chunk, then the
 *        signature of the preceding chunk
 */
auto build_chunk_string_to_sign(std::string_view amz_date,
                                std::string_view scope,
                                std::string_view previous_signature,
                                std::span<const std::byte> chunk) -> std::string;

}  // namespace kcenon::request_pipeline::aws_v4

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_AWS_V4_SIGNING_H
