/**
 * @file types.h
 * @brief Core type definitions for request_pipeline
 */

#ifndef KCENON_REQUEST_PIPELINE_CORE_TYPES_H
#define KCENON_REQUEST_PIPELINE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::request_pipeline {

/**
 * @brief Error codes for request pipeline operations
 */
enum class error_code {
    success = 0,

    // Configuration errors (-100 to -119)
    invalid_chunk_size = -100,
    invalid_memory_budget = -101,
    invalid_configuration = -102,
    missing_signer_property = -103,

    // Stream errors (-120 to -139)
    upstream_failed = -120,
    content_length_mismatch = -121,
    already_subscribed = -122,
    stream_cancelled = -123,
    stream_closed = -124,

    // Signing errors (-140 to -159)
    signing_failed = -140,
    missing_identity = -141,
    unsupported_identity = -142,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_memory_budget:
            return "invalid memory budget";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_signer_property:
            return "missing signer property";
        case error_code::upstream_failed:
            return "upstream failed";
        case error_code::content_length_mismatch:
            return "content length mismatch";
        case error_code::already_subscribed:
            return "already subscribed";
        case error_code::stream_cancelled:
            return "stream cancelled";
        case error_code::stream_closed:
            return "stream closed";
        case error_code::signing_failed:
            return "signing failed";
        case error_code::missing_identity:
            return "missing identity";
        case error_code::unsupported_identity:
            return "unsupported identity";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CORE_TYPES_H
