/**
 * @file collecting_subscriber.h
 * @brief Subscriber that gathers a byte stream into memory
 */

#ifndef KCENON_REQUEST_PIPELINE_STREAM_COLLECTING_SUBSCRIBER_H
#define KCENON_REQUEST_PIPELINE_STREAM_COLLECTING_SUBSCRIBER_H

#include <kcenon/request_pipeline/core/completion_signal.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Collects every byte of a stream
 *
 * Requests @p batch buffers at a time and refills demand once a batch has
 * been consumed. done() settles with the stream's outcome.
 *
 * @code
 * auto collector = std::make_shared<collecting_subscriber>();
 * body->subscribe(collector);
 * if (collector->done()->wait()) {
 *     use(collector->to_string());
 * }
 * @endcode
 */
class collecting_subscriber : public byte_subscriber {
public:
    explicit collecting_subscriber(uint64_t batch = std::numeric_limits<uint64_t>::max());

    void on_subscribe(std::shared_ptr<subscription> s) override;
    void on_next(byte_chunk item) override;
    void on_error(const error& err) override;
    void on_complete() override;

    /**
     * @brief Cancel the subscription and settle done() as cancelled
     */
    void cancel();

    [[nodiscard]] auto done() const -> std::shared_ptr<completion_signal> { return done_; }

    [[nodiscard]] auto bytes() const -> std::vector<std::byte>;
    [[nodiscard]] auto to_string() const -> std::string;
    [[nodiscard]] auto chunk_count() const -> std::size_t;

private:
    const uint64_t batch_;
    uint64_t remaining_in_batch_ = 0;
    std::shared_ptr<subscription> subscription_;
    std::shared_ptr<completion_signal> done_;
    mutable std::mutex mutex_;
    std::vector<std::byte> bytes_;
    std::size_t chunk_count_ = 0;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_STREAM_COLLECTING_SUBSCRIBER_H
