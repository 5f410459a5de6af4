/**
 * @file chunked_encoded_publisher.h
 * @brief Re-frames a request body as annotated HTTP/1.1 chunks
 */

#ifndef KCENON_REQUEST_PIPELINE_CHUNKED_CHUNKED_ENCODED_PUBLISHER_H
#define KCENON_REQUEST_PIPELINE_CHUNKED_CHUNKED_ENCODED_PUBLISHER_H

#include <kcenon/request_pipeline/chunked/chunk_encoder.h>
#include <kcenon/request_pipeline/chunked/chunk_extension.h>
#include <kcenon/request_pipeline/core/types.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Configuration for chunked re-framing
 */
struct chunk_encoding_config {
    /// Default chunk size (128KB)
    static constexpr uint64_t default_chunk_size = 128 * 1024;

    /// Payload bytes per data chunk (the last data chunk may be shorter)
    uint64_t chunk_size = default_chunk_size;

    /// Length of the extension text on every chunk, when it is fixed
    std::optional<uint64_t> extension_length;

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::invalid_chunk_size,
                                    "chunk size must be positive"});
        }
        return {};
    }
};

/**
 * @brief Byte publisher emitting the chunked framing of another body
 *
 * Upstream bytes are regrouped into chunks of exactly chunk_size bytes,
 * except the last data chunk, and each chunk is framed by chunk_encoder
 * with the configured extensions. The terminating zero-length chunk is
 * emitted when the source completes. The source is read one buffer at a
 * time, and the next buffer is requested once every frame produced so far
 * has been delivered.
 *
 * Each subscription resets the extensions and re-reads the source.
 */
class chunked_encoded_publisher : public byte_publisher {
public:
    /**
     * @brief Builder for chunked_encoded_publisher
     */
    class builder {
    public:
        builder();

        auto with_source(std::shared_ptr<byte_publisher> source) -> builder&;

        /**
         * @brief Set the payload size of each chunk
         * @param size Chunk size in bytes (default: 128KB)
         * @return Reference to builder for chaining
         */
        auto with_chunk_size(uint64_t size) -> builder&;

        /**
         * @brief Add an extension evaluated for every chunk
         * @return Reference to builder for chaining
         */
        auto add_extension(std::shared_ptr<chunk_extension> extension) -> builder&;

        /**
         * @brief Declare the fixed length of the extension text per chunk
         *
         * Lets content_length() report the framed length when the source
         * length is known.
         * @return Reference to builder for chaining
         */
        auto with_extension_length(uint64_t length) -> builder&;

        [[nodiscard]] auto build() -> result<std::shared_ptr<chunked_encoded_publisher>>;

    private:
        std::shared_ptr<byte_publisher> source_;
        chunk_encoding_config config_;
        std::vector<std::shared_ptr<chunk_extension>> extensions_;
    };

    /**
     * @brief Framed length, if both the source length and extension length are known
     */
    [[nodiscard]] auto content_length() const -> std::optional<uint64_t> override;

    void subscribe(std::shared_ptr<byte_subscriber> s) override;

    [[nodiscard]] auto config() const -> const chunk_encoding_config& { return config_; }

private:
    class framing_subscriber;

    chunked_encoded_publisher(std::shared_ptr<byte_publisher> source,
                              chunk_encoding_config config,
                              std::vector<std::shared_ptr<chunk_extension>> extensions);

    std::shared_ptr<byte_publisher> source_;
    chunk_encoding_config config_;
    std::vector<std::shared_ptr<chunk_extension>> extensions_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CHUNKED_CHUNKED_ENCODED_PUBLISHER_H
