/**
 * @file splitting_publisher.h
 * @brief Splits one request body into a stream of bounded parts
 */

#ifndef KCENON_REQUEST_PIPELINE_STREAM_SPLITTING_PUBLISHER_H
#define KCENON_REQUEST_PIPELINE_STREAM_SPLITTING_PUBLISHER_H

#include <kcenon/request_pipeline/core/completion_signal.h>
#include <kcenon/request_pipeline/core/types.h>
#include <kcenon/request_pipeline/stream/reactive.h>
#include <kcenon/request_pipeline/stream/simple_publisher.h>
#include <kcenon/request_pipeline/stream/split_config.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace kcenon::request_pipeline {

/**
 * @brief One bounded sub-stream of a split request body
 *
 * Created by splitting_publisher. If the parent length was known when the
 * part was created, content_length() is available immediately as
 * min(chunk size, remaining). Otherwise it becomes available once the part
 * is complete, and equals the number of bytes written to it.
 */
class part_body : public byte_publisher {
public:
    /// Receives +n when bytes are queued on the part, -n once delivered
    using buffer_listener = std::function<void(int64_t delta)>;

    part_body(uint64_t part_number, uint64_t max_length, bool length_known,
              buffer_listener listener);

    /**
     * @brief Zero-based sequence number
     */
    [[nodiscard]] auto part_number() const -> uint64_t { return part_number_; }

    /**
     * @brief Byte budget assigned to this part
     */
    [[nodiscard]] auto max_length() const -> uint64_t { return max_length_; }

    /**
     * @brief Length declared at creation, present iff the parent length was known
     */
    [[nodiscard]] auto declared_length() const -> std::optional<uint64_t>;

    [[nodiscard]] auto transferred_length() const -> uint64_t { return transferred_.load(); }

    /**
     * @brief Bytes that still fit in this part
     */
    [[nodiscard]] auto remaining() const -> uint64_t { return max_length_ - transferred_.load(); }

    [[nodiscard]] auto is_complete() const -> bool { return complete_.load(); }

    [[nodiscard]] auto content_length() const -> std::optional<uint64_t> override;

    void subscribe(std::shared_ptr<byte_subscriber> s) override;

    /**
     * @brief Append bytes; @p data must fit in remaining()
     */
    void send(byte_chunk data);

    /**
     * @brief Mark the part complete
     * @return false if it was already complete
     */
    auto complete() -> bool;

    /**
     * @brief Terminate the part's stream with @p err
     */
    void fail(const error& err);

private:
    const uint64_t part_number_;
    const uint64_t max_length_;
    const bool length_known_;
    buffer_listener listener_;
    std::shared_ptr<simple_publisher<byte_chunk>> delegate_;
    std::atomic<uint64_t> transferred_{0};
    std::atomic<bool> complete_{false};
    std::atomic<bool> failed_{false};
};

/**
 * @brief Re-publishes a byte_publisher as a sequence of part_body streams
 *
 * The source is consumed with a strict demand of one buffer at a time.
 * Each buffer is carved into the current part; when a part is full it is
 * completed and the next part is started. More data is requested only when
 * nothing is buffered, or when the buffered bytes plus the size of the last
 * buffer stay below the memory budget.
 *
 * Cancelling or failing the result signal cancels the upstream subscription.
 *
 * @code
 * auto result = completion_signal::create();
 * auto splitter = splitting_publisher::builder()
 *     .with_source(body)
 *     .with_chunk_size(8 * 1024 * 1024)
 *     .with_max_memory_usage(64 * 1024 * 1024)
 *     .with_result_signal(result)
 *     .build();
 *
 * if (splitter.has_value()) {
 *     splitter.value()->subscribe(part_uploader);
 * }
 * @endcode
 */
class splitting_publisher : public publisher<std::shared_ptr<part_body>> {
public:
    /**
     * @brief Builder for splitting_publisher
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the body to split
         * @return Reference to builder for chaining
         */
        auto with_source(std::shared_ptr<byte_publisher> source) -> builder&;

        /**
         * @brief Set the maximum part length
         * @param size Part size in bytes (default: 8MB)
         * @return Reference to builder for chaining
         */
        auto with_chunk_size(uint64_t size) -> builder&;

        /**
         * @brief Set the in-flight memory budget
         * @param bytes Budget in bytes (default: 64MB)
         * @return Reference to builder for chaining
         */
        auto with_max_memory_usage(uint64_t bytes) -> builder&;

        /**
         * @brief Apply a complete split_config
         * @return Reference to builder for chaining
         */
        auto with_config(const split_config& config) -> builder&;

        /**
         * @brief Set the signal settled when every part has been handed over
         *
         * A signal is created when none is supplied.
         * @return Reference to builder for chaining
         */
        auto with_result_signal(std::shared_ptr<completion_signal> signal) -> builder&;

        /**
         * @brief Build the splitter
         * @return Result containing the splitter or a configuration error
         */
        [[nodiscard]] auto build() -> result<std::shared_ptr<splitting_publisher>>;

    private:
        std::shared_ptr<byte_publisher> source_;
        split_config config_;
        std::shared_ptr<completion_signal> result_signal_;
    };

    ~splitting_publisher() override;

    splitting_publisher(const splitting_publisher&) = delete;
    auto operator=(const splitting_publisher&) -> splitting_publisher& = delete;

    /**
     * @brief Subscribe to the parts and start consuming the source
     *
     * Only one subscriber is accepted.
     */
    void subscribe(std::shared_ptr<subscriber<std::shared_ptr<part_body>>> s) override;

    /**
     * @brief Signal settled once all parts were delivered, or on failure
     */
    [[nodiscard]] auto result_signal() const -> std::shared_ptr<completion_signal>;

    [[nodiscard]] auto config() const -> const split_config&;

    /**
     * @brief Bytes handed to parts but not yet delivered to their consumers
     */
    [[nodiscard]] auto bytes_in_flight() const -> uint64_t;

    [[nodiscard]] auto peak_bytes_in_flight() const -> uint64_t;

    [[nodiscard]] auto parts_created() const -> uint64_t;

private:
    struct impl;

    explicit splitting_publisher(std::shared_ptr<impl> state);

    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_STREAM_SPLITTING_PUBLISHER_H
