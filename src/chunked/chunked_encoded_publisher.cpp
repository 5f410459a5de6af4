/**
 * @file chunked_encoded_publisher.cpp
 * @brief Implementation of chunked_encoded_publisher
 */

#include <kcenon/request_pipeline/chunked/chunked_encoded_publisher.h>
#include <kcenon/request_pipeline/core/logging.h>
#include <kcenon/request_pipeline/stream/simple_publisher.h>

#include <atomic>
#include <mutex>

namespace kcenon::request_pipeline {

// ============================================================================
// framing_subscriber
// ============================================================================

class chunked_encoded_publisher::framing_subscriber
    : public byte_subscriber,
      public std::enable_shared_from_this<framing_subscriber> {
public:
    framing_subscriber(uint64_t chunk_size,
                       std::vector<std::shared_ptr<chunk_extension>> extensions,
                       std::shared_ptr<simple_publisher<byte_chunk>> downstream)
        : chunk_size_(chunk_size),
          encoder_(std::move(extensions)),
          downstream_(std::move(downstream)) {
        encoder_.reset();
    }

    void on_subscribe(std::shared_ptr<subscription> s) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            upstream_ = s;
        }
        awaiting_upstream_.store(true);
        s->request(1);
    }

    void on_next(byte_chunk item) override {
        awaiting_upstream_.store(false);

        auto view = item.span();
        pending_.insert(pending_.end(), view.begin(), view.end());

        std::size_t offset = 0;
        while (pending_.size() - offset >= chunk_size_) {
            emit(encoder_.encode_chunk(
                std::span<const std::byte>(pending_.data() + offset, chunk_size_)));
            offset += chunk_size_;
        }
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));

        if (frames_in_flight_.load() == 0) {
            request_next();
        }
    }

    void on_error(const error& err) override {
        RP_LOG_ERROR(log_category::chunk_encoding, "Source failed: " + err.message);
        release_upstream();
        downstream_->fail(err);
    }

    void on_complete() override {
        release_upstream();
        if (!pending_.empty()) {
            emit(encoder_.encode_chunk(pending_));
            pending_.clear();
        }
        emit(encoder_.encode_final_chunk());
        downstream_->complete();
    }

    void cancel_upstream() {
        std::shared_ptr<subscription> s;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            s.swap(upstream_);
        }
        if (s) {
            RP_LOG_DEBUG(log_category::chunk_encoding, "Framed body cancelled");
            s->cancel();
        }
    }

private:
    void emit(byte_chunk frame) {
        frames_in_flight_.fetch_add(1);
        std::weak_ptr<framing_subscriber> weak = weak_from_this();
        downstream_->send(std::move(frame))->when_settled([weak](const result<void>& delivered) {
            auto self = weak.lock();
            if (!self || !delivered) {
                return;
            }
            if (self->frames_in_flight_.fetch_sub(1) == 1) {
                self->request_next();
            }
        });
    }

    void request_next() {
        bool expected = false;
        if (!awaiting_upstream_.compare_exchange_strong(expected, true)) {
            return;
        }
        std::shared_ptr<subscription> s;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            s = upstream_;
        }
        if (s) {
            s->request(1);
        }
    }

    void release_upstream() {
        std::lock_guard<std::mutex> lock(mutex_);
        upstream_.reset();
    }

    const uint64_t chunk_size_;
    chunk_encoder encoder_;
    std::shared_ptr<simple_publisher<byte_chunk>> downstream_;

    std::mutex mutex_;
    std::shared_ptr<subscription> upstream_;
    std::atomic<bool> awaiting_upstream_{false};
    std::atomic<uint64_t> frames_in_flight_{0};

    // Touched only from upstream signals
    std::vector<std::byte> pending_;
};

// ============================================================================
// chunked_encoded_publisher::builder
// ============================================================================

chunked_encoded_publisher::builder::builder() = default;

auto chunked_encoded_publisher::builder::with_source(std::shared_ptr<byte_publisher> source)
    -> builder& {
    source_ = std::move(source);
    return *this;
}

auto chunked_encoded_publisher::builder::with_chunk_size(uint64_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto chunked_encoded_publisher::builder::add_extension(std::shared_ptr<chunk_extension> extension)
    -> builder& {
    if (extension) {
        extensions_.push_back(std::move(extension));
    }
    return *this;
}

auto chunked_encoded_publisher::builder::with_extension_length(uint64_t length) -> builder& {
    config_.extension_length = length;
    return *this;
}

auto chunked_encoded_publisher::builder::build()
    -> result<std::shared_ptr<chunked_encoded_publisher>> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (!source_) {
        return unexpected(error{error_code::invalid_configuration, "source is required"});
    }
    return std::shared_ptr<chunked_encoded_publisher>(
        new chunked_encoded_publisher(source_, config_, extensions_));
}

// ============================================================================
// chunked_encoded_publisher
// ============================================================================

chunked_encoded_publisher::chunked_encoded_publisher(
    std::shared_ptr<byte_publisher> source,
    chunk_encoding_config config,
    std::vector<std::shared_ptr<chunk_extension>> extensions)
    : source_(std::move(source)),
      config_(std::move(config)),
      extensions_(std::move(extensions)) {}

auto chunked_encoded_publisher::content_length() const -> std::optional<uint64_t> {
    auto payload = source_->content_length();
    if (!payload || !config_.extension_length) {
        return std::nullopt;
    }
    return chunk_encoder::framed_length(*payload, config_.chunk_size, *config_.extension_length);
}

void chunked_encoded_publisher::subscribe(std::shared_ptr<byte_subscriber> s) {
    auto frames = simple_publisher<byte_chunk>::create();
    auto framing = std::make_shared<framing_subscriber>(config_.chunk_size, extensions_, frames);

    std::weak_ptr<framing_subscriber> weak = framing;
    frames->set_on_cancel([weak]() {
        if (auto self = weak.lock()) {
            self->cancel_upstream();
        }
    });

    frames->subscribe(std::move(s));
    source_->subscribe(framing);
}

}  // namespace kcenon::request_pipeline
