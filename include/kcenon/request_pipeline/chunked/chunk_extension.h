/**
 * @file chunk_extension.h
 * @brief Per-chunk name/value annotations for chunked transfer encoding
 *
 * Per RFC 7230 section 4.1.1 a chunk size line may carry extensions:
 * @code
 * chunk-ext      = *( ";" chunk-ext-name [ "=" chunk-ext-val ] )
 * @endcode
 * A chunk_extension computes one such pair from the bytes of the chunk it
 * annotates.
 */

#ifndef KCENON_REQUEST_PIPELINE_CHUNKED_CHUNK_EXTENSION_H
#define KCENON_REQUEST_PIPELINE_CHUNKED_CHUNK_EXTENSION_H

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace kcenon::request_pipeline {

/**
 * @brief Name/value pair written after a chunk's size as ";name=value"
 */
struct chunk_annotation {
    std::string name;
    std::string value;

    [[nodiscard]] auto operator==(const chunk_annotation& other) const -> bool = default;
};

/**
 * @brief Computes an optional annotation for each chunk
 *
 * The framing layer calls compute() once per chunk, in chunk order,
 * including the terminating zero-length chunk. Implementations that carry
 * state from one chunk to the next (a running digest, a signature chain)
 * must restore their initial state in reset() so that a new attempt of the
 * same request produces the same annotations.
 */
class chunk_extension {
public:
    virtual ~chunk_extension() = default;

    /**
     * @brief Annotation for @p chunk, or std::nullopt to omit it
     */
    [[nodiscard]] virtual auto compute(std::span<const std::byte> chunk)
        -> std::optional<chunk_annotation> = 0;

    /**
     * @brief Restore the initial state
     */
    virtual void reset() {}
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CHUNKED_CHUNK_EXTENSION_H
