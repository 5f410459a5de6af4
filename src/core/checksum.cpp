/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/request_pipeline/core/checksum.h>

#include <array>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace kcenon::request_pipeline {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

// Generate CRC32 lookup table at compile time
constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

// CRC32 lookup table (generated at compile time)
constexpr auto CRC32_TABLE = generate_crc32_table();

constexpr char HEX_DIGITS[] = "0123456789abcdef";

}  // namespace

auto checksum::crc32(std::span<const std::byte> data, uint32_t previous) -> uint32_t {
    uint32_t crc = previous ^ 0xFFFFFFFF;

    for (std::byte b : data) {
        uint8_t index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }

    return crc ^ 0xFFFFFFFF;
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

auto checksum::sha256_digest(std::span<const std::byte> data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return hash;
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    return to_hex(sha256_digest(data));
}

auto checksum::sha256(std::string_view data) -> std::string {
    return sha256(as_bytes(data));
}

auto checksum::hmac_sha256(std::span<const uint8_t> key, std::string_view data)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         mac.data(),
         &len);

    mac.resize(len);
    return mac;
}

auto checksum::to_hex(std::span<const uint8_t> bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t byte : bytes) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

}  // namespace kcenon::request_pipeline
