/**
 * @file request_pipeline.h
 * @brief Main header for the request_pipeline library
 * @version 0.1.0
 *
 * Streaming and signing stages of an outbound HTTP request: the bounded
 * stream splitter, the signing dispatcher and chunk extensions.
 *
 * @code
 * #include <kcenon/request_pipeline/request_pipeline.h>
 *
 * using namespace kcenon::request_pipeline;
 *
 * auto parts = splitting_publisher::builder()
 *     .with_source(body)
 *     .with_chunk_size(8 * 1024 * 1024)
 *     .with_max_memory_usage(64 * 1024 * 1024)
 *     .build();
 *
 * signing_stage stage;
 * auto signed_request = stage.execute(request, context).get();
 * @endcode
 */

#ifndef KCENON_REQUEST_PIPELINE_REQUEST_PIPELINE_H
#define KCENON_REQUEST_PIPELINE_REQUEST_PIPELINE_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/request_pipeline/core/types.h"
#include "kcenon/request_pipeline/core/completion_signal.h"

// Streams
#include "kcenon/request_pipeline/stream/in_memory_byte_publisher.h"
#include "kcenon/request_pipeline/stream/collecting_subscriber.h"
#include "kcenon/request_pipeline/stream/splitting_publisher.h"

// Chunked framing
#include "kcenon/request_pipeline/chunked/chunked_encoded_publisher.h"
#include "kcenon/request_pipeline/chunked/crc32_chunk_extension.h"
#include "kcenon/request_pipeline/chunked/sigv4_chunk_signature_extension.h"

// Signing
#include "kcenon/request_pipeline/signing/aws_v4_signer.h"
#include "kcenon/request_pipeline/signing/signing_stage.h"

// Adapters
#include "kcenon/request_pipeline/adapters/monitoring_metric_collector.h"

namespace kcenon::request_pipeline {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_REQUEST_PIPELINE_H
