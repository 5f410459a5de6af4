/**
 * @file in_memory_byte_publisher.h
 * @brief Request body backed by buffers held in memory
 */

#ifndef KCENON_REQUEST_PIPELINE_STREAM_IN_MEMORY_BYTE_PUBLISHER_H
#define KCENON_REQUEST_PIPELINE_STREAM_IN_MEMORY_BYTE_PUBLISHER_H

#include <kcenon/request_pipeline/core/types.h>
#include <kcenon/request_pipeline/stream/byte_chunk.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Replays a fixed list of buffers to each subscriber
 *
 * Every subscription starts from the first buffer, so the same body can be
 * sent again for a fresh attempt. Buffers are delivered only on demand.
 */
class in_memory_byte_publisher : public byte_publisher {
public:
    /**
     * @brief Construct from buffers
     * @param chunks Buffers delivered in order
     * @param declared_length Length reported by content_length()
     */
    in_memory_byte_publisher(std::vector<byte_chunk> chunks,
                             std::optional<uint64_t> declared_length);

    /**
     * @brief Body of @p text delivered in buffers of @p buffer_size bytes
     * @param text Body content
     * @param buffer_size Buffer size, 0 delivers the whole text at once
     * @param length_known Whether content_length() reports the text size
     */
    [[nodiscard]] static auto from_string(std::string_view text,
                                          std::size_t buffer_size = 0,
                                          bool length_known = true)
        -> std::shared_ptr<in_memory_byte_publisher>;

    /**
     * @brief Terminate each replay with @p err instead of completing
     */
    void set_failure(error err);

    [[nodiscard]] auto content_length() const -> std::optional<uint64_t> override;

    void subscribe(std::shared_ptr<byte_subscriber> s) override;

private:
    std::vector<byte_chunk> chunks_;
    std::optional<uint64_t> declared_length_;
    std::optional<error> failure_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_STREAM_IN_MEMORY_BYTE_PUBLISHER_H
