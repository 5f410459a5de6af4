// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/request_pipeline/config/feature_flags.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::request_pipeline {

/**
 * @brief Log categories for the request pipeline
 */
struct log_category {
    static constexpr std::string_view splitter = "request_pipeline.splitter";
    static constexpr std::string_view stream = "request_pipeline.stream";
    static constexpr std::string_view signing = "request_pipeline.signing";
    static constexpr std::string_view chunk_encoding = "request_pipeline.chunk_encoding";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Which signing material is hidden before a message leaves the logger
 */
struct masking_config {
    bool mask_signatures = true;
    bool mask_credentials = true;
    char mask_char = '*';
    std::size_t visible_chars = 4;  ///< Leading access key characters kept

    static masking_config all_masked() { return {}; }

    static masking_config none() { return {false, false, '*', 4}; }
};

/**
 * @brief Masks SigV4 signatures and access key ids in log text
 *
 * - `Signature=<hex>` and `chunk-signature=<hex>` values are fully masked.
 * - `Credential=<access key>/<scope>` keeps the first visible_chars of the key.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::all_masked())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string out = input;
        if (config_.mask_signatures) {
            static const std::regex signature(R"(((?:chunk-)?[Ss]ignature=)([0-9a-fA-F]+))");
            out = rewrite_values(out, signature, [this](const std::string& hex) {
                return std::string(hex.size(), config_.mask_char);
            });
        }
        if (config_.mask_credentials) {
            static const std::regex credential(R"((Credential=)([A-Za-z0-9]+))");
            out = rewrite_values(out, credential,
                                 [this](const std::string& key) { return mask_access_key(key); });
        }
        return out;
    }

    [[nodiscard]] auto mask_access_key(const std::string& key) const -> std::string {
        if (!config_.mask_credentials || key.size() <= config_.visible_chars) {
            return key;
        }
        std::string out = key;
        std::fill(out.begin() + static_cast<std::ptrdiff_t>(config_.visible_chars), out.end(),
                  config_.mask_char);
        return out;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    /// Replace capture group 2 of every match, keeping group 1 (the key=)
    template <typename Rewrite>
    static auto rewrite_values(const std::string& input, const std::regex& pattern,
                               Rewrite rewrite) -> std::string {
        std::string out;
        out.reserve(input.size());
        auto tail = input.cbegin();
        for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
            const auto& match = *it;
            out.append(tail, match[1].first);
            out += match[1].str();
            out += rewrite(match[2].str());
            tail = match[0].second;
        }
        out.append(tail, input.cend());
        return out;
    }

    masking_config config_;
};

namespace detail {

inline void append_json_string(std::ostringstream& oss, const std::string& value) {
    oss << '"';
    for (char c : value) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

}  // namespace detail

/**
 * @brief Structured fields attached to a splitter or signing log line
 *
 * Only the fields that are set are rendered.
 */
struct pipeline_log_context {
    std::optional<uint64_t> part_number;
    std::optional<uint64_t> content_length;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> bytes_in_flight;
    std::optional<std::string> strategy;
    std::optional<std::string> scheme_id;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Render as a flat JSON object
     * @param masker Applied to error_message when given
     */
    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        const char* sep = "";
        auto key = [&](const char* name) {
            oss << sep << '"' << name << "\":";
            sep = ",";
        };

        oss << '{';
        for (const auto& [name, value] : {std::pair{"part_number", part_number},
                                          std::pair{"content_length", content_length},
                                          std::pair{"bytes_transferred", bytes_transferred},
                                          std::pair{"bytes_in_flight", bytes_in_flight}}) {
            if (value) {
                key(name);
                oss << *value;
            }
        }
        if (strategy) {
            key("strategy");
            detail::append_json_string(oss, *strategy);
        }
        if (scheme_id) {
            key("scheme_id");
            detail::append_json_string(oss, *scheme_id);
        }
        if (duration_ms) {
            key("duration_ms");
            oss << *duration_ms;
        }
        if (error_message) {
            key("error_message");
            detail::append_json_string(oss, masker ? masker->mask(*error_message)
                                                   : *error_message);
        }
        oss << '}';
        return oss.str();
    }
};

class request_pipeline_logger;

request_pipeline_logger& get_logger();

/**
 * @brief Process-wide logger for the request pipeline
 *
 * Messages below the minimum level are dropped. The rest are masked, handed
 * to the callback if one is set, and written to logger_system when it is
 * built in or to stderr otherwise.
 */
class request_pipeline_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const pipeline_log_context*)>;

    request_pipeline_logger() = default;
    ~request_pipeline_logger() = default;

    request_pipeline_logger(const request_pipeline_logger&) = delete;
    request_pipeline_logger& operator=(const request_pipeline_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(mutex_);
        return masker_.get_config();
    }

    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    /**
     * @brief Receive every message that passes the level filter, already masked
     *
     * Pass nullptr to remove the callback.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const pipeline_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) {
            return;
        }

        sensitive_info_masker masker;
        log_callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            masker = masker_;
            callback = callback_;
        }

        const std::string masked = masker.mask(std::string(message));
        if (callback) {
            callback(level, category, masked, context);
        }

        std::ostringstream line_text;
        line_text << '[' << category << "] " << masked;
        if (context) {
            line_text << ' ' << context->to_json(&masker);
        }

#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text.str());
            }
        }
#else
        write_stderr(level, line_text.str());
#endif
    }

    void flush() {
#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
#if REQUEST_PIPELINE_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
        }
        return kcenon::logger::log_level::info;
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#else
    static void write_stderr(log_level level, const std::string& text) {
        const auto now = std::chrono::system_clock::now();
        const auto seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
#if defined(_WIN32)
        localtime_s(&local, &seconds);
#else
        localtime_r(&seconds, &local);
#endif

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << millis.count() << " [" << log_level_to_string(level)
                  << "] " << text << "\n";
    }
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    mutable std::mutex mutex_;
    log_callback callback_;
    sensitive_info_masker masker_;
};

inline request_pipeline_logger& get_logger() {
    static request_pipeline_logger instance;
    return instance;
}

#define RP_LOG(level, category, message) \
    kcenon::request_pipeline::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define RP_LOG_CTX(level, category, message, context) \
    kcenon::request_pipeline::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define RP_LOG_TRACE(category, message) \
    RP_LOG(kcenon::request_pipeline::log_level::trace, category, message)

#define RP_LOG_DEBUG(category, message) \
    RP_LOG(kcenon::request_pipeline::log_level::debug, category, message)

#define RP_LOG_INFO(category, message) \
    RP_LOG(kcenon::request_pipeline::log_level::info, category, message)

#define RP_LOG_WARN(category, message) \
    RP_LOG(kcenon::request_pipeline::log_level::warn, category, message)

#define RP_LOG_ERROR(category, message) \
    RP_LOG(kcenon::request_pipeline::log_level::error, category, message)

#define RP_LOG_TRACE_CTX(category, message, ctx) \
    RP_LOG_CTX(kcenon::request_pipeline::log_level::trace, category, message, ctx)

#define RP_LOG_DEBUG_CTX(category, message, ctx) \
    RP_LOG_CTX(kcenon::request_pipeline::log_level::debug, category, message, ctx)

#define RP_LOG_INFO_CTX(category, message, ctx) \
    RP_LOG_CTX(kcenon::request_pipeline::log_level::info, category, message, ctx)

#define RP_LOG_WARN_CTX(category, message, ctx) \
    RP_LOG_CTX(kcenon::request_pipeline::log_level::warn, category, message, ctx)

#define RP_LOG_ERROR_CTX(category, message, ctx) \
    RP_LOG_CTX(kcenon::request_pipeline::log_level::error, category, message, ctx)

}  // namespace kcenon::request_pipeline
