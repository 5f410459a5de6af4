/**
 * @file collecting_subscriber.cpp
 * @brief Implementation of collecting_subscriber
 */

#include <kcenon/request_pipeline/stream/collecting_subscriber.h>

namespace kcenon::request_pipeline {

collecting_subscriber::collecting_subscriber(uint64_t batch)
    : batch_(batch == 0 ? 1 : batch), done_(completion_signal::create()) {}

void collecting_subscriber::on_subscribe(std::shared_ptr<subscription> s) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription_ = s;
        remaining_in_batch_ = batch_;
    }
    s->request(batch_);
}

void collecting_subscriber::on_next(byte_chunk item) {
    std::shared_ptr<subscription> refill;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto view = item.span();
        bytes_.insert(bytes_.end(), view.begin(), view.end());
        ++chunk_count_;

        if (batch_ != std::numeric_limits<uint64_t>::max() && --remaining_in_batch_ == 0) {
            remaining_in_batch_ = batch_;
            refill = subscription_;
        }
    }
    if (refill) {
        refill->request(batch_);
    }
}

void collecting_subscriber::on_error(const error& err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription_.reset();
    }
    done_->fail(err);
}

void collecting_subscriber::on_complete() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscription_.reset();
    }
    done_->complete();
}

void collecting_subscriber::cancel() {
    std::shared_ptr<subscription> s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.swap(subscription_);
    }
    if (s) {
        s->cancel();
    }
    done_->cancel();
}

auto collecting_subscriber::bytes() const -> std::vector<std::byte> {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

auto collecting_subscriber::to_string() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::string(reinterpret_cast<const char*>(bytes_.data()), bytes_.size());
}

auto collecting_subscriber::chunk_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunk_count_;
}

}  // namespace kcenon::request_pipeline
