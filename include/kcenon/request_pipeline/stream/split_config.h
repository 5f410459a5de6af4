/**
 * @file split_config.h
 * @brief Configuration for splitting a request body into parts
 */

#ifndef KCENON_REQUEST_PIPELINE_STREAM_SPLIT_CONFIG_H
#define KCENON_REQUEST_PIPELINE_STREAM_SPLIT_CONFIG_H

#include <kcenon/request_pipeline/core/types.h>

#include <cstdint>
#include <string>

namespace kcenon::request_pipeline {

/**
 * @brief Configuration for splitting_publisher
 */
struct split_config {
    /// Default part size (8MB)
    static constexpr uint64_t default_chunk_size = 8 * 1024 * 1024;

    /// Default in-flight memory budget (64MB)
    static constexpr uint64_t default_max_memory_usage = 64 * 1024 * 1024;

    /// Upper bound on the length of each part
    uint64_t chunk_size = default_chunk_size;

    /// Advisory bound on bytes buffered but not yet consumed by a part
    uint64_t max_memory_usage = default_max_memory_usage;

    split_config() = default;

    split_config(uint64_t chunk, uint64_t memory)
        : chunk_size(chunk), max_memory_usage(memory) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::invalid_chunk_size,
                                    "chunk size must be positive"});
        }
        if (max_memory_usage == 0) {
            return unexpected(error{error_code::invalid_memory_budget,
                                    "max memory usage must be positive"});
        }
        return {};
    }

    /**
     * @brief Number of parts produced for a body of known length
     * @return At least 1; an empty body yields one empty part
     */
    [[nodiscard]] auto calculate_part_count(uint64_t content_length) const -> uint64_t {
        if (content_length == 0) return 1;
        return (content_length + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_STREAM_SPLIT_CONFIG_H
