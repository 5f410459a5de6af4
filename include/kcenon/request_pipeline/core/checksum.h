/**
 * @file checksum.h
 * @brief Checksum and digest utilities for chunk annotations and signing
 */

#ifndef KCENON_REQUEST_PIPELINE_CORE_CHECKSUM_H
#define KCENON_REQUEST_PIPELINE_CORE_CHECKSUM_H

#include <kcenon/request_pipeline/core/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Checksum utilities for CRC32, SHA-256 and HMAC-SHA256
 *
 * Provides static methods for:
 * - CRC32 calculation, optionally continued from a previous value
 * - SHA-256 digests (OpenSSL)
 * - HMAC-SHA256 (OpenSSL)
 * - Lowercase hex encoding
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     * @param data Input data span
     * @param previous CRC of the preceding bytes, 0 to start a new checksum
     * @return CRC32 checksum value
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data, uint32_t previous = 0)
        -> uint32_t;

    /**
     * @brief Verify CRC32 checksum of data
     */
    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;

    /**
     * @brief SHA-256 digest of data
     * @return 32 raw digest bytes
     */
    [[nodiscard]] static auto sha256_digest(std::span<const std::byte> data)
        -> std::vector<uint8_t>;

    /**
     * @brief SHA-256 of data as lowercase hex
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief SHA-256 of a string as lowercase hex
     */
    [[nodiscard]] static auto sha256(std::string_view data) -> std::string;

    /**
     * @brief HMAC-SHA256
     * @param key Raw key bytes
     * @param data Message
     * @return 32 raw MAC bytes
     */
    [[nodiscard]] static auto hmac_sha256(std::span<const uint8_t> key, std::string_view data)
        -> std::vector<uint8_t>;

    /**
     * @brief Lowercase hex encoding
     */
    [[nodiscard]] static auto to_hex(std::span<const uint8_t> bytes) -> std::string;
};

/**
 * @brief View a string's characters as bytes
 */
[[nodiscard]] inline auto as_bytes(std::string_view text) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CORE_CHECKSUM_H
