/**
 * @file sigv4_chunk_signature_extension.cpp
 * @brief Implementation of sigv4_chunk_signature_extension
 */

#include <kcenon/request_pipeline/chunked/sigv4_chunk_signature_extension.h>
#include <kcenon/request_pipeline/signing/aws_v4_signing.h>

namespace kcenon::request_pipeline {

sigv4_chunk_signature_extension::sigv4_chunk_signature_extension(std::vector<uint8_t> signing_key,
                                                                 std::string amz_date,
                                                                 std::string scope,
                                                                 std::string seed_signature)
    : signing_key_(std::move(signing_key)),
      amz_date_(std::move(amz_date)),
      scope_(std::move(scope)),
      seed_signature_(std::move(seed_signature)),
      previous_signature_(seed_signature_) {}

auto sigv4_chunk_signature_extension::compute(std::span<const std::byte> chunk)
    -> std::optional<chunk_annotation> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto string_to_sign =
        aws_v4::build_chunk_string_to_sign(amz_date_, scope_, previous_signature_, chunk);
    previous_signature_ = aws_v4::compute_signature(signing_key_, string_to_sign);
    return chunk_annotation{std::string(aws_v4::chunk_signature_name), previous_signature_};
}

void sigv4_chunk_signature_extension::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    previous_signature_ = seed_signature_;
}

}  // namespace kcenon::request_pipeline
