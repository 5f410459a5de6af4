/**
 * @file crc32_chunk_extension.h
 * @brief Running CRC-32 chunk annotation
 */

#ifndef KCENON_REQUEST_PIPELINE_CHUNKED_CRC32_CHUNK_EXTENSION_H
#define KCENON_REQUEST_PIPELINE_CHUNKED_CRC32_CHUNK_EXTENSION_H

#include <kcenon/request_pipeline/chunked/chunk_extension.h>

#include <cstdint>
#include <mutex>
#include <string>

namespace kcenon::request_pipeline {

/**
 * @brief Annotates each chunk with the CRC-32 of all bytes framed so far
 *
 * The value is 8 lowercase hex digits. For a body framed as chunks
 * c0, c1, ... the annotation of chunk k is crc32(c0 + ... + ck), so the
 * final chunk carries the checksum of the whole body.
 */
class crc32_chunk_extension : public chunk_extension {
public:
    static constexpr const char* default_name = "chunk-crc32";

    explicit crc32_chunk_extension(std::string name = default_name);

    [[nodiscard]] auto compute(std::span<const std::byte> chunk)
        -> std::optional<chunk_annotation> override;

    void reset() override;

    /**
     * @brief CRC-32 of every byte seen since the last reset
     */
    [[nodiscard]] auto current() const -> uint32_t;

private:
    const std::string name_;
    mutable std::mutex mutex_;
    uint32_t crc_ = 0;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CHUNKED_CRC32_CHUNK_EXTENSION_H
