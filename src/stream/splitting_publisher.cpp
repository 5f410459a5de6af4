/**
 * @file splitting_publisher.cpp
 * @brief Implementation of splitting_publisher and part_body
 */

#include <kcenon/request_pipeline/stream/splitting_publisher.h>
#include <kcenon/request_pipeline/core/logging.h>

#include <algorithm>
#include <mutex>
#include <string>

namespace kcenon::request_pipeline {

// ============================================================================
// part_body
// ============================================================================

part_body::part_body(uint64_t part_number, uint64_t max_length, bool length_known,
                     buffer_listener listener)
    : part_number_(part_number),
      max_length_(max_length),
      length_known_(length_known),
      listener_(std::move(listener)),
      delegate_(simple_publisher<byte_chunk>::create()) {}

auto part_body::declared_length() const -> std::optional<uint64_t> {
    if (length_known_) {
        return max_length_;
    }
    return std::nullopt;
}

auto part_body::content_length() const -> std::optional<uint64_t> {
    if (length_known_) {
        return max_length_;
    }
    if (complete_.load()) {
        return transferred_.load();
    }
    return std::nullopt;
}

void part_body::subscribe(std::shared_ptr<byte_subscriber> s) {
    delegate_->subscribe(std::move(s));
}

void part_body::send(byte_chunk data) {
    const auto length = static_cast<int64_t>(data.size());
    transferred_.fetch_add(data.size());
    if (listener_) {
        listener_(length);
    }

    auto listener = listener_;
    std::weak_ptr<simple_publisher<byte_chunk>> weak_delegate = delegate_;
    delegate_->send(std::move(data))->when_settled(
        [listener, weak_delegate, length](const result<void>& delivered) {
            if (listener) {
                listener(-length);
            }
            if (!delivered) {
                if (auto delegate = weak_delegate.lock()) {
                    delegate->fail(delivered.error());
                }
            }
        });
}

auto part_body::complete() -> bool {
    bool expected = false;
    if (!complete_.compare_exchange_strong(expected, true)) {
        return false;
    }
    RP_LOG_DEBUG(log_category::splitter,
                 "Part " + std::to_string(part_number_) + " complete, length " +
                     std::to_string(transferred_.load()));
    delegate_->complete();
    return true;
}

void part_body::fail(const error& err) {
    bool expected = false;
    if (!failed_.compare_exchange_strong(expected, true)) {
        return;
    }
    delegate_->fail(err);
}

// ============================================================================
// splitting_publisher::impl
// ============================================================================

struct splitting_publisher::impl : public byte_subscriber,
                                   public std::enable_shared_from_this<splitting_publisher::impl> {
    std::shared_ptr<byte_publisher> source;
    split_config config;
    std::optional<uint64_t> upstream_size;
    std::shared_ptr<completion_signal> result_signal;
    std::shared_ptr<simple_publisher<std::shared_ptr<part_body>>> downstream;

    mutable std::mutex mutex;
    std::shared_ptr<subscription> upstream_subscription;
    std::shared_ptr<part_body> current_part;

    std::atomic<uint64_t> part_number{0};
    std::atomic<uint64_t> parts_created{0};
    std::atomic<bool> has_open_upstream_demand{false};
    std::atomic<int64_t> bytes_buffered{0};
    std::atomic<int64_t> peak_buffered{0};
    std::atomic<uint64_t> buffer_size_hint{0};
    std::atomic<bool> upstream_complete{false};
    std::atomic<bool> terminated{false};
    std::atomic<bool> subscribed{false};

    // Touched only from upstream signals, which are serialized
    uint64_t bytes_seen = 0;

    impl(std::shared_ptr<byte_publisher> src, split_config cfg,
         std::shared_ptr<completion_signal> signal)
        : source(std::move(src)),
          config(cfg),
          upstream_size(source->content_length()),
          result_signal(std::move(signal)),
          downstream(simple_publisher<std::shared_ptr<part_body>>::create()) {}

    void watch_result() {
        std::weak_ptr<impl> weak = weak_from_this();

        result_signal->when_settled([weak](const result<void>& outcome) {
            if (outcome) {
                return;
            }
            if (auto self = weak.lock()) {
                self->abort(outcome.error());
            }
        });

        downstream->set_on_cancel([weak]() {
            if (auto self = weak.lock()) {
                RP_LOG_DEBUG(log_category::splitter, "Parts subscriber cancelled");
                self->result_signal->cancel();
            }
        });
    }

    // ------------------------------------------------------------------------
    // Upstream signals
    // ------------------------------------------------------------------------

    void on_subscribe(std::shared_ptr<subscription> s) override {
        bool settled_early = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            settled_early = terminated.load();
            if (!settled_early) {
                upstream_subscription = s;
            }
        }
        if (settled_early) {
            s->cancel();
            return;
        }

        auto first = create_part(0, initial_part_size());
        set_current(first);

        // Part 0 must exist before on_next can arrive
        has_open_upstream_demand.store(true);
        s->request(1);
    }

    void on_next(byte_chunk buffer) override {
        has_open_upstream_demand.store(false);
        if (terminated.load()) {
            return;
        }

        buffer_size_hint.store(buffer.size());

        if (upstream_size && bytes_seen + buffer.size() > *upstream_size) {
            fail_run(error{error_code::content_length_mismatch,
                           "source delivered more than its declared " +
                               std::to_string(*upstream_size) + " bytes"});
            cancel_upstream();
            return;
        }
        bytes_seen += buffer.size();

        auto part = current();
        while (!buffer.empty()) {
            if (part->remaining() == 0) {
                // Leftover bytes always open the next part
                complete_part(part);
                const auto next = part_number.fetch_add(1) + 1;
                part = create_part(next, next_part_size(next));
                set_current(part);
            }

            const auto take = static_cast<std::size_t>(
                std::min<uint64_t>(part->remaining(), buffer.size()));
            part->send(buffer.slice(0, take));
            buffer = buffer.slice(take, buffer.size() - take);
        }

        maybe_request_more();
    }

    void on_error(const error& err) override {
        RP_LOG_ERROR(log_category::splitter, "Source failed: " + err.message);
        release_upstream();
        fail_run(err);
    }

    void on_complete() override {
        upstream_complete.store(true);
        release_upstream();
        if (upstream_size && bytes_seen < *upstream_size) {
            pipeline_log_context log_ctx;
            log_ctx.content_length = *upstream_size;
            log_ctx.bytes_transferred = bytes_seen;
            log_ctx.part_number = part_number.load();
            RP_LOG_ERROR_CTX(log_category::splitter, "Source ended before its declared length",
                             log_ctx);
            fail_run(error{error_code::content_length_mismatch,
                           "source delivered fewer than its declared " +
                               std::to_string(*upstream_size) + " bytes"});
            return;
        }
        if (terminated.exchange(true)) {
            return;
        }

        if (auto part = current()) {
            complete_part(part);
        }

        RP_LOG_DEBUG(log_category::splitter,
                     "Source complete after " + std::to_string(bytes_seen) + " bytes in " +
                         std::to_string(parts_created.load()) + " parts");

        auto signal = result_signal;
        downstream->complete()->when_settled([signal](const result<void>& handed_over) {
            if (handed_over) {
                signal->complete();
            } else {
                signal->fail(handed_over.error());
            }
        });
    }

    // ------------------------------------------------------------------------
    // Parts
    // ------------------------------------------------------------------------

    auto create_part(uint64_t number, uint64_t max_length) -> std::shared_ptr<part_body> {
        std::weak_ptr<impl> weak = weak_from_this();
        auto part = std::make_shared<part_body>(
            number, max_length, upstream_size.has_value(), [weak](int64_t delta) {
                if (auto self = weak.lock()) {
                    self->add_buffered(delta);
                }
            });
        parts_created.fetch_add(1);

        // Known length: publish right away, the final length is already fixed
        if (upstream_size) {
            publish(part);
        }
        return part;
    }

    void complete_part(const std::shared_ptr<part_body>& part) {
        if (!part->complete()) {
            return;
        }
        if (!upstream_size) {
            publish(part);
        }
    }

    void publish(const std::shared_ptr<part_body>& part) {
        std::weak_ptr<simple_publisher<std::shared_ptr<part_body>>> weak_parts = downstream;
        downstream->send(part)->when_settled([weak_parts](const result<void>& delivered) {
            if (delivered) {
                return;
            }
            if (auto parts = weak_parts.lock()) {
                parts->fail(delivered.error());
            }
        });
    }

    [[nodiscard]] auto initial_part_size() const -> uint64_t {
        if (!upstream_size) {
            return config.chunk_size;
        }
        return std::min(config.chunk_size, *upstream_size);
    }

    [[nodiscard]] auto next_part_size(uint64_t number) const -> uint64_t {
        if (!upstream_size) {
            return config.chunk_size;
        }
        const uint64_t consumed = number * config.chunk_size;
        const uint64_t remaining = consumed >= *upstream_size ? 0 : *upstream_size - consumed;
        return std::min(config.chunk_size, remaining);
    }

    // ------------------------------------------------------------------------
    // Flow control
    // ------------------------------------------------------------------------

    void add_buffered(int64_t delta) {
        const auto now = bytes_buffered.fetch_add(delta) + delta;
        if (delta > 0) {
            auto peak = peak_buffered.load();
            while (now > peak && !peak_buffered.compare_exchange_weak(peak, now)) {
            }
            return;
        }
        maybe_request_more();
    }

    [[nodiscard]] auto should_request_more(int64_t buffered) const -> bool {
        const auto hint = static_cast<int64_t>(buffer_size_hint.load());
        return buffered == 0 ||
               buffered + hint < static_cast<int64_t>(config.max_memory_usage);
    }

    void maybe_request_more() {
        if (terminated.load() || upstream_complete.load()) {
            return;
        }
        const auto buffered = bytes_buffered.load();
        if (!should_request_more(buffered)) {
            return;
        }
        bool expected = false;
        if (!has_open_upstream_demand.compare_exchange_strong(expected, true)) {
            return;
        }

        std::shared_ptr<subscription> s;
        {
            std::lock_guard<std::mutex> lock(mutex);
            s = upstream_subscription;
        }
        if (s) {
            s->request(1);
        }
    }

    // ------------------------------------------------------------------------
    // Termination
    // ------------------------------------------------------------------------

    void fail_run(const error& err) {
        if (terminated.exchange(true)) {
            return;
        }
        if (auto part = current()) {
            part->fail(err);
        }
        downstream->fail(err);
        result_signal->fail(err);
    }

    void abort(const error& err) {
        RP_LOG_DEBUG(log_category::splitter,
                     "Result settled with '" + err.message + "', cancelling source");
        cancel_upstream();
        fail_run(err);
    }

    void cancel_upstream() {
        std::shared_ptr<subscription> s;
        {
            std::lock_guard<std::mutex> lock(mutex);
            s.swap(upstream_subscription);
        }
        if (s) {
            s->cancel();
        }
    }

    void release_upstream() {
        std::lock_guard<std::mutex> lock(mutex);
        upstream_subscription.reset();
    }

    [[nodiscard]] auto current() const -> std::shared_ptr<part_body> {
        std::lock_guard<std::mutex> lock(mutex);
        return current_part;
    }

    void set_current(std::shared_ptr<part_body> part) {
        std::lock_guard<std::mutex> lock(mutex);
        current_part = std::move(part);
    }
};

// ============================================================================
// splitting_publisher::builder
// ============================================================================

splitting_publisher::builder::builder() = default;

auto splitting_publisher::builder::with_source(std::shared_ptr<byte_publisher> source)
    -> builder& {
    source_ = std::move(source);
    return *this;
}

auto splitting_publisher::builder::with_chunk_size(uint64_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto splitting_publisher::builder::with_max_memory_usage(uint64_t bytes) -> builder& {
    config_.max_memory_usage = bytes;
    return *this;
}

auto splitting_publisher::builder::with_config(const split_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto splitting_publisher::builder::with_result_signal(std::shared_ptr<completion_signal> signal)
    -> builder& {
    result_signal_ = std::move(signal);
    return *this;
}

auto splitting_publisher::builder::build() -> result<std::shared_ptr<splitting_publisher>> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (!source_) {
        return unexpected(error{error_code::invalid_configuration, "source is required"});
    }

    if (!source_->content_length() && config_.max_memory_usage < config_.chunk_size) {
        RP_LOG_WARN(log_category::splitter,
                    "Memory budget is smaller than the chunk size for a body of unknown "
                    "length; parts are only released once full");
    }

    auto signal = result_signal_ ? result_signal_ : completion_signal::create();
    auto state = std::make_shared<impl>(source_, config_, std::move(signal));
    state->watch_result();

    return std::shared_ptr<splitting_publisher>(new splitting_publisher(std::move(state)));
}

// ============================================================================
// splitting_publisher
// ============================================================================

splitting_publisher::splitting_publisher(std::shared_ptr<impl> state)
    : impl_(std::move(state)) {}

splitting_publisher::~splitting_publisher() = default;

void splitting_publisher::subscribe(std::shared_ptr<subscriber<std::shared_ptr<part_body>>> s) {
    impl_->downstream->subscribe(std::move(s));

    if (impl_->subscribed.exchange(true)) {
        return;
    }
    impl_->source->subscribe(impl_);
}

auto splitting_publisher::result_signal() const -> std::shared_ptr<completion_signal> {
    return impl_->result_signal;
}

auto splitting_publisher::config() const -> const split_config& {
    return impl_->config;
}

auto splitting_publisher::bytes_in_flight() const -> uint64_t {
    return static_cast<uint64_t>(std::max<int64_t>(0, impl_->bytes_buffered.load()));
}

auto splitting_publisher::peak_bytes_in_flight() const -> uint64_t {
    return static_cast<uint64_t>(std::max<int64_t>(0, impl_->peak_buffered.load()));
}

auto splitting_publisher::parts_created() const -> uint64_t {
    return impl_->parts_created.load();
}

}  // namespace kcenon::request_pipeline
