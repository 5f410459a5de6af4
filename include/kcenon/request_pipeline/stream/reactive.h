/**
 * @file reactive.h
 * @brief Demand-driven publisher/subscriber interfaces
 *
 * The protocol mirrors the usual reactive-streams contract:
 * - a publisher calls on_subscribe exactly once per subscriber;
 * - on_next is only called for units previously requested through
 *   subscription::request();
 * - at most one of on_error / on_complete terminates the stream;
 * - signals to one subscriber are never delivered concurrently.
 */

#ifndef KCENON_REQUEST_PIPELINE_STREAM_REACTIVE_H
#define KCENON_REQUEST_PIPELINE_STREAM_REACTIVE_H

#include <kcenon/request_pipeline/core/types.h>
#include <kcenon/request_pipeline/stream/byte_chunk.h>

#include <cstdint>
#include <memory>
#include <optional>

namespace kcenon::request_pipeline {

/**
 * @brief Link between one publisher and one subscriber
 */
class subscription {
public:
    virtual ~subscription() = default;

    /**
     * @brief Signal demand for @p n more items (zero is ignored)
     */
    virtual void request(uint64_t n) = 0;

    /**
     * @brief Stop delivery; no further signals follow
     */
    virtual void cancel() = 0;
};

/**
 * @brief Receiver of a stream of T
 */
template <typename T>
class subscriber {
public:
    virtual ~subscriber() = default;

    virtual void on_subscribe(std::shared_ptr<subscription> s) = 0;
    virtual void on_next(T item) = 0;
    virtual void on_error(const error& err) = 0;
    virtual void on_complete() = 0;
};

/**
 * @brief Source of a stream of T
 */
template <typename T>
class publisher {
public:
    virtual ~publisher() = default;

    virtual void subscribe(std::shared_ptr<subscriber<T>> s) = 0;
};

using byte_subscriber = subscriber<byte_chunk>;

/**
 * @brief Asynchronous request body
 *
 * An ordered sequence of byte buffers that may declare its total length
 * before any byte is seen.
 */
class byte_publisher : public publisher<byte_chunk> {
public:
    /**
     * @brief Total length in bytes, if known
     */
    [[nodiscard]] virtual auto content_length() const -> std::optional<uint64_t> = 0;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_STREAM_REACTIVE_H
