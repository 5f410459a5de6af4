/**
 * @file crc32_chunk_extension.cpp
 * @brief Implementation of crc32_chunk_extension
 */

#include <kcenon/request_pipeline/chunked/crc32_chunk_extension.h>
#include <kcenon/request_pipeline/core/checksum.h>

#include <array>

namespace kcenon::request_pipeline {

crc32_chunk_extension::crc32_chunk_extension(std::string name) : name_(std::move(name)) {}

auto crc32_chunk_extension::compute(std::span<const std::byte> chunk)
    -> std::optional<chunk_annotation> {
    uint32_t value = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        crc_ = checksum::crc32(chunk, crc_);
        value = crc_;
    }

    const std::array<uint8_t, 4> be{
        static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
    return chunk_annotation{name_, checksum::to_hex(be)};
}

void crc32_chunk_extension::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    crc_ = 0;
}

auto crc32_chunk_extension::current() const -> uint32_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return crc_;
}

}  // namespace kcenon::request_pipeline
