/**
 * @file signing_clock.h
 * @brief Clocks used to timestamp signatures
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_CLOCK_H
#define KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_CLOCK_H

#include <chrono>

namespace kcenon::request_pipeline {

/**
 * @brief Source of the instant a signature is computed for
 */
class signing_clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~signing_clock() = default;

    [[nodiscard]] virtual auto now() const -> time_point = 0;
};

/**
 * @brief System time shifted back by a clock-skew offset
 *
 * now() returns system_clock::now() - offset, so a positive offset means
 * the local clock runs ahead of the service.
 */
class offset_signing_clock : public signing_clock {
public:
    explicit offset_signing_clock(std::chrono::seconds offset) : offset_(offset) {}

    [[nodiscard]] auto now() const -> time_point override {
        return std::chrono::system_clock::now() - offset_;
    }

    [[nodiscard]] auto offset() const -> std::chrono::seconds { return offset_; }

private:
    std::chrono::seconds offset_;
};

/**
 * @brief Clock frozen at one instant
 */
class fixed_signing_clock : public signing_clock {
public:
    explicit fixed_signing_clock(time_point instant) : instant_(instant) {}

    [[nodiscard]] auto now() const -> time_point override { return instant_; }

private:
    time_point instant_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_SIGNING_CLOCK_H
