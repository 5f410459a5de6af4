/**
 * @file aws_v4_signer.h
 * @brief AWS Signature Version 4 signers
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_AWS_V4_SIGNER_H
#define KCENON_REQUEST_PIPELINE_SIGNING_AWS_V4_SIGNER_H

#include <kcenon/request_pipeline/core/attribute_map.h>
#include <kcenon/request_pipeline/signing/http_signer.h>
#include <kcenon/request_pipeline/signing/legacy_signer.h>

#include <cstdint>
#include <string>

namespace kcenon::request_pipeline {

/**
 * @brief SigV4 signer used through an auth scheme
 *
 * Requires an aws_credentials_identity and the region_name and
 * service_signing_name properties. The signature is computed at the time
 * given by http_signer::signing_clock_property.
 *
 * sign_async() either hashes the whole payload into x-amz-content-sha256,
 * or, with chunk_encoding_enabled, signs the request for a streaming
 * payload and returns the body re-framed as aws-chunked with a
 * chunk-signature on every chunk.
 *
 * @code
 * auth_scheme_option option{"aws.auth#sigv4", {}};
 * option.signer_properties.put(aws_v4_signer::region_name, std::string("us-east-1"));
 * option.signer_properties.put(aws_v4_signer::service_signing_name, std::string("s3"));
 * option.signer_properties.put(aws_v4_signer::chunk_encoding_enabled, true);
 * @endcode
 */
class aws_v4_signer : public http_signer {
public:
    static constexpr attribute_key<std::string> region_name{"RegionName"};
    static constexpr attribute_key<std::string> service_signing_name{"ServiceSigningName"};
    static constexpr attribute_key<bool> chunk_encoding_enabled{"ChunkEncodingEnabled"};
    static constexpr attribute_key<uint64_t> chunk_size{"ChunkSize"};

    /// Default aws-chunked chunk size (128KB)
    static constexpr uint64_t default_chunk_size = 128 * 1024;

    [[nodiscard]] auto sign(const sign_request& request) -> result<signed_request> override;

    [[nodiscard]] auto sign_async(const async_sign_request& request)
        -> std::future<result<async_signed_request>> override;
};

/**
 * @brief SigV4 signer configured through execution attributes
 *
 * Reads execution_attributes::aws_credentials, signing_region,
 * service_signing_name and time_offset. With chunk encoding enabled the
 * headers are signed for a streaming payload (the Content-Length header,
 * when present, becomes x-amz-decoded-content-length) and
 * sign_async_request_body() wraps the body in signed aws-chunked framing.
 */
class aws_v4_legacy_signer : public async_request_body_signer {
public:
    struct options {
        bool chunk_encoding = false;
        uint64_t chunk_size = aws_v4_signer::default_chunk_size;
    };

    aws_v4_legacy_signer();
    explicit aws_v4_legacy_signer(options opts);

    [[nodiscard]] auto sign(http_request_ptr request, attribute_map& attributes)
        -> result<http_request_ptr> override;

    [[nodiscard]] auto sign_async_request_body(http_request_ptr signed_request,
                                               std::shared_ptr<byte_publisher> body,
                                               attribute_map& attributes)
        -> std::shared_ptr<byte_publisher> override;

private:
    options options_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_AWS_V4_SIGNER_H
