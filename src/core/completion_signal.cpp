/**
 * @file completion_signal.cpp
 * @brief Implementation of completion_signal
 */

#include <kcenon/request_pipeline/core/completion_signal.h>

namespace kcenon::request_pipeline {

auto completion_signal::create() -> std::shared_ptr<completion_signal> {
    return std::make_shared<completion_signal>();
}

auto completion_signal::completed() -> std::shared_ptr<completion_signal> {
    auto signal = create();
    signal->complete();
    return signal;
}

auto completion_signal::failed(error err) -> std::shared_ptr<completion_signal> {
    auto signal = create();
    signal->fail(std::move(err));
    return signal;
}

auto completion_signal::complete() -> bool {
    return settle(state::completed, error{});
}

auto completion_signal::fail(error err) -> bool {
    return settle(state::failed, std::move(err));
}

auto completion_signal::cancel() -> bool {
    return settle(state::cancelled, error{error_code::stream_cancelled});
}

auto completion_signal::settle(state new_state, error err) -> bool {
    std::vector<callback> to_run;
    result<void> outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != state::pending) {
            return false;
        }
        state_ = new_state;
        error_ = std::move(err);
        to_run.swap(callbacks_);
        outcome = outcome_locked();
    }
    cv_.notify_all();

    // Callbacks run outside the lock so they may touch this signal again
    for (auto& cb : to_run) {
        cb(outcome);
    }
    return true;
}

void completion_signal::when_settled(callback cb) {
    result<void> outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state::pending) {
            callbacks_.push_back(std::move(cb));
            return;
        }
        outcome = outcome_locked();
    }
    cb(outcome);
}

auto completion_signal::wait() const -> result<void> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return state_ != state::pending; });
    return outcome_locked();
}

auto completion_signal::wait_for(std::chrono::milliseconds timeout) const
    -> std::optional<result<void>> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return state_ != state::pending; })) {
        return std::nullopt;
    }
    return outcome_locked();
}

auto completion_signal::current_state() const -> state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto completion_signal::is_done() const -> bool {
    return current_state() != state::pending;
}

auto completion_signal::is_cancelled() const -> bool {
    return current_state() == state::cancelled;
}

auto completion_signal::outcome_locked() const -> result<void> {
    if (state_ == state::completed) {
        return {};
    }
    return unexpected(error_);
}

}  // namespace kcenon::request_pipeline
