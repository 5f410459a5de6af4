/**
 * @file stream_test_support.h
 * @brief Hand-written stream fakes shared by the unit tests
 */

#ifndef KCENON_REQUEST_PIPELINE_TESTS_STREAM_TEST_SUPPORT_H
#define KCENON_REQUEST_PIPELINE_TESTS_STREAM_TEST_SUPPORT_H

#include <kcenon/request_pipeline/core/completion_signal.h>
#include <kcenon/request_pipeline/stream/reactive.h>
#include <kcenon/request_pipeline/stream/splitting_publisher.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::request_pipeline::test {

/**
 * @brief Source that hands out fixed buffers on demand, on the caller's thread
 *
 * Records every request() so tests can check the demand a consumer keeps
 * open. A request issued from inside on_next only adds demand.
 */
class scripted_source : public byte_publisher,
                        public std::enable_shared_from_this<scripted_source> {
public:
    explicit scripted_source(std::vector<std::string> buffers, bool length_known = true)
        : buffers_(std::move(buffers)) {
        if (length_known) {
            uint64_t total = 0;
            for (const auto& b : buffers_) {
                total += b.size();
            }
            declared_ = total;
        }
    }

    static auto create(std::vector<std::string> buffers, bool length_known = true)
        -> std::shared_ptr<scripted_source> {
        return std::make_shared<scripted_source>(std::move(buffers), length_known);
    }

    void declare_length(std::optional<uint64_t> length) { declared_ = length; }

    /**
     * @brief Emit @p err instead of the buffer at index @p index
     */
    void fail_at(std::size_t index, error err) {
        fail_index_ = index;
        failure_ = std::move(err);
    }

    auto content_length() const -> std::optional<uint64_t> override { return declared_; }

    void subscribe(std::shared_ptr<byte_subscriber> s) override {
        subscriber_ = s;
        s->on_subscribe(std::make_shared<link>(shared_from_this()));
        drain();
    }

    auto request_calls() const -> uint64_t { return request_calls_.load(); }
    auto max_outstanding() const -> uint64_t { return max_outstanding_.load(); }
    auto delivered() const -> std::size_t { return next_; }
    auto cancelled() const -> bool { return cancelled_.load(); }

private:
    class link : public subscription {
    public:
        explicit link(std::shared_ptr<scripted_source> source) : source_(std::move(source)) {}

        void request(uint64_t n) override {
            if (n > 0) {
                source_->on_request(n);
            }
        }

        void cancel() override { source_->cancelled_.store(true); }

    private:
        std::shared_ptr<scripted_source> source_;
    };

    void on_request(uint64_t n) {
        request_calls_.fetch_add(1);
        demand_ += n;
        max_outstanding_.store(std::max(max_outstanding_.load(), demand_));
        drain();
    }

    void drain() {
        if (draining_) {
            return;
        }
        draining_ = true;
        while (!done_ && !cancelled_.load() && subscriber_) {
            auto target = subscriber_;
            if (failure_ && next_ == fail_index_) {
                done_ = true;
                subscriber_.reset();
                target->on_error(*failure_);
                break;
            }
            if (next_ == buffers_.size()) {
                done_ = true;
                subscriber_.reset();
                target->on_complete();
                break;
            }
            if (demand_ == 0) {
                break;
            }
            --demand_;
            target->on_next(byte_chunk::from_string(buffers_[next_++]));
        }
        draining_ = false;
    }

    std::vector<std::string> buffers_;
    std::optional<uint64_t> declared_;
    std::optional<error> failure_;
    std::size_t fail_index_ = 0;

    std::shared_ptr<byte_subscriber> subscriber_;
    std::size_t next_ = 0;
    uint64_t demand_ = 0;
    bool draining_ = false;
    bool done_ = false;

    std::atomic<uint64_t> request_calls_{0};
    std::atomic<uint64_t> max_outstanding_{0};
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Byte subscriber that only requests when told to
 */
class manual_reader : public byte_subscriber {
public:
    void on_subscribe(std::shared_ptr<subscription> s) override { subscription_ = s; }

    void on_next(byte_chunk item) override { text_ += item.to_string(); }

    void on_error(const error& err) override {
        error_ = err;
        subscription_.reset();
    }

    void on_complete() override {
        complete_ = true;
        subscription_.reset();
    }

    void pull(uint64_t n) {
        if (auto s = subscription_) {
            s->request(n);
        }
    }

    void pull_all() { pull(std::numeric_limits<uint64_t>::max()); }

    void cancel() {
        auto s = std::move(subscription_);
        if (s) {
            s->cancel();
        }
    }

    auto text() const -> const std::string& { return text_; }
    auto is_complete() const -> bool { return complete_; }
    auto failure() const -> const std::optional<error>& { return error_; }

private:
    std::shared_ptr<subscription> subscription_;
    std::string text_;
    bool complete_ = false;
    std::optional<error> error_;
};

/**
 * @brief Subscriber of the parts stream that attaches a manual_reader to each part
 */
class part_collector : public subscriber<std::shared_ptr<part_body>> {
public:
    explicit part_collector(bool read_parts = true) : read_parts_(read_parts) {}

    void on_subscribe(std::shared_ptr<subscription> s) override {
        subscription_ = s;
        s->request(std::numeric_limits<uint64_t>::max());
    }

    void on_next(std::shared_ptr<part_body> part) override {
        auto reader = std::make_shared<manual_reader>();
        parts_.push_back(part);
        readers_.push_back(reader);
        part->subscribe(reader);
        if (read_parts_) {
            reader->pull_all();
        }
    }

    void on_error(const error& err) override { error_ = err; }

    void on_complete() override { complete_ = true; }

    /**
     * @brief Start reading every part, including parts published later
     */
    void read_all() {
        read_parts_ = true;
        for (std::size_t i = 0; i < readers_.size(); ++i) {
            auto reader = readers_[i];
            reader->pull_all();
        }
    }

    void cancel() {
        if (auto s = subscription_) {
            s->cancel();
        }
    }

    auto parts() const -> const std::vector<std::shared_ptr<part_body>>& { return parts_; }
    auto readers() const -> const std::vector<std::shared_ptr<manual_reader>>& {
        return readers_;
    }

    auto contents() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& r : readers_) {
            out.push_back(r->text());
        }
        return out;
    }

    auto is_complete() const -> bool { return complete_; }
    auto failure() const -> const std::optional<error>& { return error_; }

private:
    bool read_parts_;
    std::shared_ptr<subscription> subscription_;
    std::vector<std::shared_ptr<part_body>> parts_;
    std::vector<std::shared_ptr<manual_reader>> readers_;
    bool complete_ = false;
    std::optional<error> error_;
};

}  // namespace kcenon::request_pipeline::test

#endif  // KCENON_REQUEST_PIPELINE_TESTS_STREAM_TEST_SUPPORT_H
