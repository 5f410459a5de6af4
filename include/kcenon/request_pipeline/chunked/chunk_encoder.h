/**
 * @file chunk_encoder.h
 * @brief Chunked transfer-encoding framing with chunk extensions
 */

#ifndef KCENON_REQUEST_PIPELINE_CHUNKED_CHUNK_ENCODER_H
#define KCENON_REQUEST_PIPELINE_CHUNKED_CHUNK_ENCODER_H

#include <kcenon/request_pipeline/chunked/chunk_extension.h>
#include <kcenon/request_pipeline/stream/byte_chunk.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Frames payload bytes as HTTP/1.1 chunks
 *
 * Data chunk:  hex(size) *(";" name "=" value) CRLF data CRLF
 * Final chunk: "0" *(";" name "=" value) CRLF CRLF
 *
 * Extensions are evaluated in registration order for every chunk, the
 * final chunk included.
 */
class chunk_encoder {
public:
    explicit chunk_encoder(std::vector<std::shared_ptr<chunk_extension>> extensions = {});

    /**
     * @brief Frame one data chunk
     */
    [[nodiscard]] auto encode_chunk(std::span<const std::byte> data) -> byte_chunk;

    /**
     * @brief Frame the terminating zero-length chunk
     */
    [[nodiscard]] auto encode_final_chunk() -> byte_chunk;

    /**
     * @brief Reset every extension for a new attempt
     */
    void reset();

    /**
     * @brief Total framed length of a payload
     * @param payload_length Unframed payload bytes
     * @param chunk_size Size of every chunk except possibly the last data chunk
     * @param extension_length Length of the ";name=value" text on each chunk
     */
    [[nodiscard]] static auto framed_length(uint64_t payload_length,
                                            uint64_t chunk_size,
                                            uint64_t extension_length) -> uint64_t;

private:
    [[nodiscard]] auto extension_text(std::span<const std::byte> data) -> std::string;

    std::vector<std::shared_ptr<chunk_extension>> extensions_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CHUNKED_CHUNK_ENCODER_H
