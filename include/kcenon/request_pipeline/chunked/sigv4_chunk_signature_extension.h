/**
 * @file sigv4_chunk_signature_extension.h
 * @brief Chained SigV4 signatures for aws-chunked bodies
 */

#ifndef KCENON_REQUEST_PIPELINE_CHUNKED_SIGV4_CHUNK_SIGNATURE_EXTENSION_H
#define KCENON_REQUEST_PIPELINE_CHUNKED_SIGV4_CHUNK_SIGNATURE_EXTENSION_H

#include <kcenon/request_pipeline/chunked/chunk_extension.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Emits chunk-signature=<hex> on every chunk
 *
 * The first chunk is signed against the seed signature (the request's own
 * signature); each later chunk against the signature of the chunk before
 * it. reset() rewinds the chain to the seed.
 */
class sigv4_chunk_signature_extension : public chunk_extension {
public:
    sigv4_chunk_signature_extension(std::vector<uint8_t> signing_key,
                                    std::string amz_date,
                                    std::string scope,
                                    std::string seed_signature);

    [[nodiscard]] auto compute(std::span<const std::byte> chunk)
        -> std::optional<chunk_annotation> override;

    void reset() override;

    [[nodiscard]] auto seed_signature() const -> const std::string& { return seed_signature_; }

private:
    const std::vector<uint8_t> signing_key_;
    const std::string amz_date_;
    const std::string scope_;
    const std::string seed_signature_;

    std::mutex mutex_;
    std::string previous_signature_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CHUNKED_SIGV4_CHUNK_SIGNATURE_EXTENSION_H
