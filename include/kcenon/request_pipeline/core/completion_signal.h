/**
 * @file completion_signal.h
 * @brief Settle-once completion signal with callbacks and cancellation
 */

#ifndef KCENON_REQUEST_PIPELINE_CORE_COMPLETION_SIGNAL_H
#define KCENON_REQUEST_PIPELINE_CORE_COMPLETION_SIGNAL_H

#include <kcenon/request_pipeline/core/types.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief A one-shot completion that can be observed, awaited or cancelled
 *
 * The signal settles exactly once, as completed, failed or cancelled.
 * Callbacks registered before settlement run on the settling thread;
 * callbacks registered afterwards run immediately on the caller's thread.
 *
 * @code
 * auto signal = completion_signal::create();
 * signal->when_settled([](const result<void>& r) {
 *     if (!r) { handle(r.error()); }
 * });
 * signal->complete();
 * @endcode
 */
class completion_signal {
public:
    using callback = std::function<void(const result<void>&)>;

    /**
     * @brief Settlement state
     */
    enum class state { pending, completed, failed, cancelled };

    [[nodiscard]] static auto create() -> std::shared_ptr<completion_signal>;

    /**
     * @brief Create an already completed signal
     */
    [[nodiscard]] static auto completed() -> std::shared_ptr<completion_signal>;

    /**
     * @brief Create an already failed signal
     */
    [[nodiscard]] static auto failed(error err) -> std::shared_ptr<completion_signal>;

    completion_signal() = default;

    completion_signal(const completion_signal&) = delete;
    auto operator=(const completion_signal&) -> completion_signal& = delete;

    /**
     * @brief Settle successfully
     * @return false if the signal was already settled
     */
    auto complete() -> bool;

    /**
     * @brief Settle with an error
     * @return false if the signal was already settled
     */
    auto fail(error err) -> bool;

    /**
     * @brief Settle as cancelled (error_code::stream_cancelled)
     * @return false if the signal was already settled
     */
    auto cancel() -> bool;

    /**
     * @brief Register a callback invoked once the signal settles
     */
    void when_settled(callback cb);

    /**
     * @brief Block until settled
     */
    [[nodiscard]] auto wait() const -> result<void>;

    /**
     * @brief Block until settled or the timeout elapses
     * @return Outcome, or std::nullopt on timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const
        -> std::optional<result<void>>;

    [[nodiscard]] auto current_state() const -> state;
    [[nodiscard]] auto is_done() const -> bool;
    [[nodiscard]] auto is_cancelled() const -> bool;

private:
    auto settle(state new_state, error err) -> bool;
    [[nodiscard]] auto outcome_locked() const -> result<void>;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    state state_ = state::pending;
    error error_;
    std::vector<callback> callbacks_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CORE_COMPLETION_SIGNAL_H
