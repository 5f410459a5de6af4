/**
 * @file chunk_encoder.cpp
 * @brief Implementation of chunk_encoder
 */

#include <kcenon/request_pipeline/chunked/chunk_encoder.h>

#include <string_view>

namespace kcenon::request_pipeline {

namespace {

constexpr char CRLF[] = "\r\n";

auto to_hex_length(uint64_t value) -> std::string {
    constexpr char digits[] = "0123456789abcdef";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value != 0) {
        out.insert(out.begin(), digits[value & 0x0F]);
        value >>= 4;
    }
    return out;
}

void append(std::vector<std::byte>& out, std::string_view text) {
    const auto* begin = reinterpret_cast<const std::byte*>(text.data());
    out.insert(out.end(), begin, begin + text.size());
}

}  // namespace

chunk_encoder::chunk_encoder(std::vector<std::shared_ptr<chunk_extension>> extensions)
    : extensions_(std::move(extensions)) {}

auto chunk_encoder::encode_chunk(std::span<const std::byte> data) -> byte_chunk {
    const std::string header = to_hex_length(data.size()) + extension_text(data) + CRLF;

    std::vector<std::byte> framed;
    framed.reserve(header.size() + data.size() + 2);
    append(framed, header);
    framed.insert(framed.end(), data.begin(), data.end());
    append(framed, CRLF);
    return byte_chunk(std::move(framed));
}

auto chunk_encoder::encode_final_chunk() -> byte_chunk {
    const std::string trailer = "0" + extension_text({}) + CRLF + CRLF;
    return byte_chunk::from_string(trailer);
}

void chunk_encoder::reset() {
    for (auto& extension : extensions_) {
        extension->reset();
    }
}

auto chunk_encoder::framed_length(uint64_t payload_length,
                                  uint64_t chunk_size,
                                  uint64_t extension_length) -> uint64_t {
    auto chunk_overhead = [extension_length](uint64_t size) -> uint64_t {
        return to_hex_length(size).size() + extension_length + 2 + size + 2;
    };

    uint64_t total = 0;
    if (chunk_size > 0) {
        total += (payload_length / chunk_size) * chunk_overhead(chunk_size);
        if (const auto tail = payload_length % chunk_size; tail > 0) {
            total += chunk_overhead(tail);
        }
    }

    // Final chunk has no data and a single CRLF before the closing CRLF
    total += 1 + extension_length + 2 + 2;
    return total;
}

auto chunk_encoder::extension_text(std::span<const std::byte> data) -> std::string {
    std::string text;
    for (auto& extension : extensions_) {
        if (auto annotation = extension->compute(data)) {
            text += ';';
            text += annotation->name;
            text += '=';
            text += annotation->value;
        }
    }
    return text;
}

}  // namespace kcenon::request_pipeline
