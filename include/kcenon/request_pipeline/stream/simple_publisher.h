/**
 * @file simple_publisher.h
 * @brief Single-subscriber publisher fed by explicit send/complete/fail calls
 */

#ifndef KCENON_REQUEST_PIPELINE_STREAM_SIMPLE_PUBLISHER_H
#define KCENON_REQUEST_PIPELINE_STREAM_SIMPLE_PUBLISHER_H

#include <kcenon/request_pipeline/core/completion_signal.h>
#include <kcenon/request_pipeline/stream/reactive.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>

namespace kcenon::request_pipeline {

/**
 * @brief Queueing publisher that honours subscriber demand
 *
 * Items handed to send() are queued and delivered in order once the
 * subscriber has requested them. Each call returns a completion_signal that
 * completes after the item (or terminal signal) has been delivered, and
 * fails with stream_cancelled if the subscriber cancels first.
 *
 * Delivery is serialized through a drain loop: a request() issued from
 * inside on_next() only adds demand and the outer loop delivers the next
 * item, so synchronous producers never recurse.
 *
 * Completion and failure are delivered without waiting for demand, after
 * every item queued before them.
 *
 * @code
 * auto pub = simple_publisher<byte_chunk>::create();
 * pub->subscribe(consumer);
 * pub->send(byte_chunk::from_string("hello"))->when_settled(on_delivered);
 * pub->complete();
 * @endcode
 */
template <typename T>
class simple_publisher : public publisher<T>,
                         public std::enable_shared_from_this<simple_publisher<T>> {
public:
    [[nodiscard]] static auto create() -> std::shared_ptr<simple_publisher> {
        return std::shared_ptr<simple_publisher>(new simple_publisher());
    }

    simple_publisher(const simple_publisher&) = delete;
    auto operator=(const simple_publisher&) -> simple_publisher& = delete;

    /**
     * @brief Attach the single subscriber
     *
     * A second subscriber receives on_subscribe followed by on_error
     * (already_subscribed). Items sent before subscription stay queued.
     */
    void subscribe(std::shared_ptr<subscriber<T>> s) override {
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!subscribed_) {
                subscribed_ = true;
                subscriber_ = s;
                // Hold delivery until on_subscribe returns
                subscribing_ = true;
                accepted = true;
            }
        }

        if (!accepted) {
            s->on_subscribe(std::make_shared<noop_subscription>());
            s->on_error(error{error_code::already_subscribed});
            return;
        }

        s->on_subscribe(std::make_shared<publisher_subscription>(this->shared_from_this()));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscribing_ = false;
        }
        drain();
    }

    /**
     * @brief Queue an item for delivery
     * @return Signal completed once the item reached on_next
     */
    auto send(T item) -> std::shared_ptr<completion_signal> {
        auto ack = completion_signal::create();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return completion_signal::failed(error{error_code::stream_cancelled});
            }
            if (terminal_queued_) {
                return completion_signal::failed(error{error_code::stream_closed});
            }
            entry e;
            e.kind = entry_kind::item;
            e.value = std::move(item);
            e.ack = ack;
            queue_.push_back(std::move(e));
        }
        drain();
        return ack;
    }

    /**
     * @brief Queue successful completion after all pending items
     */
    auto complete() -> std::shared_ptr<completion_signal> {
        return enqueue_terminal(entry_kind::completion, error{});
    }

    /**
     * @brief Queue failure after all pending items
     */
    auto fail(error err) -> std::shared_ptr<completion_signal> {
        return enqueue_terminal(entry_kind::failure, std::move(err));
    }

    /**
     * @brief Hook invoked once when the subscriber cancels
     */
    void set_on_cancel(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_cancel_ = std::move(hook);
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    enum class entry_kind { item, completion, failure };

    struct entry {
        entry_kind kind = entry_kind::item;
        std::optional<T> value;
        error err;
        std::shared_ptr<completion_signal> ack;
    };

    class publisher_subscription : public subscription {
    public:
        explicit publisher_subscription(std::shared_ptr<simple_publisher> owner)
            : owner_(std::move(owner)) {}

        void request(uint64_t n) override { owner_->add_demand(n); }
        void cancel() override { owner_->cancel_delivery(); }

    private:
        std::shared_ptr<simple_publisher> owner_;
    };

    class noop_subscription : public subscription {
    public:
        void request(uint64_t) override {}
        void cancel() override {}
    };

    simple_publisher() = default;

    auto enqueue_terminal(entry_kind kind, error err) -> std::shared_ptr<completion_signal> {
        auto ack = completion_signal::create();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return completion_signal::failed(error{error_code::stream_cancelled});
            }
            if (terminal_queued_) {
                return completion_signal::failed(error{error_code::stream_closed});
            }
            terminal_queued_ = true;
            entry e;
            e.kind = kind;
            e.err = std::move(err);
            e.ack = ack;
            queue_.push_back(std::move(e));
        }
        drain();
        return ack;
    }

    void add_demand(uint64_t n) {
        if (n == 0) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || terminated_) {
                return;
            }
            constexpr auto unbounded = std::numeric_limits<uint64_t>::max();
            demand_ = (demand_ > unbounded - n) ? unbounded : demand_ + n;
        }
        drain();
    }

    void cancel_delivery() {
        std::deque<entry> dropped;
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || terminated_) {
                return;
            }
            cancelled_ = true;
            subscriber_.reset();
            dropped.swap(queue_);
            hook = std::move(on_cancel_);
        }
        for (auto& e : dropped) {
            e.ack->fail(error{error_code::stream_cancelled});
        }
        if (hook) {
            hook();
        }
    }

    void drain() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (draining_) {
                return;
            }
            draining_ = true;
        }
        drain_owned();
    }

    void drain_owned() {
        for (;;) {
            entry next;
            std::shared_ptr<subscriber<T>> target;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!can_deliver_locked()) {
                    draining_ = false;
                    return;
                }
                next = std::move(queue_.front());
                queue_.pop_front();
                target = subscriber_;
                if (next.kind == entry_kind::item) {
                    if (demand_ != std::numeric_limits<uint64_t>::max()) {
                        --demand_;
                    }
                } else {
                    terminated_ = true;
                    subscriber_.reset();
                }
            }

            switch (next.kind) {
                case entry_kind::item:
                    target->on_next(std::move(*next.value));
                    break;
                case entry_kind::completion:
                    target->on_complete();
                    break;
                case entry_kind::failure:
                    target->on_error(next.err);
                    break;
            }
            next.ack->complete();
        }
    }

    [[nodiscard]] auto can_deliver_locked() const -> bool {
        if (!subscriber_ || subscribing_ || cancelled_ || queue_.empty()) {
            return false;
        }
        return queue_.front().kind != entry_kind::item || demand_ > 0;
    }

    mutable std::mutex mutex_;
    std::deque<entry> queue_;
    std::shared_ptr<subscriber<T>> subscriber_;
    std::function<void()> on_cancel_;
    uint64_t demand_ = 0;
    bool subscribed_ = false;
    bool subscribing_ = false;
    bool draining_ = false;
    bool terminal_queued_ = false;
    bool terminated_ = false;
    bool cancelled_ = false;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_STREAM_SIMPLE_PUBLISHER_H
