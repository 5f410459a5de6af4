/**
 * @file metric_collector.h
 * @brief Sink for per-attempt duration metrics
 */

#ifndef KCENON_REQUEST_PIPELINE_METRICS_METRIC_COLLECTOR_H
#define KCENON_REQUEST_PIPELINE_METRICS_METRIC_COLLECTOR_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Names of the metrics reported by the pipeline
 */
struct metric_names {
    /// Time spent inside a signer call
    static constexpr std::string_view signing_duration = "SigningDuration";
};

/**
 * @brief Receives (name, duration) pairs
 *
 * Implementations must tolerate concurrent calls; asynchronous signing
 * reports from a continuation thread.
 */
class metric_collector {
public:
    virtual ~metric_collector() = default;

    virtual void report_metric(std::string_view name, std::chrono::nanoseconds value) = 0;
};

/**
 * @brief Collector that keeps every reported value in memory
 *
 * @code
 * auto metrics = std::make_shared<in_memory_metric_collector>();
 * context->set_metrics(metrics);
 * // ... execute the signing stage ...
 * auto took = metrics->last(metric_names::signing_duration);
 * @endcode
 */
class in_memory_metric_collector : public metric_collector {
public:
    /**
     * @brief One reported value
     */
    struct record {
        std::string name;
        std::chrono::nanoseconds value{0};
    };

    in_memory_metric_collector();
    ~in_memory_metric_collector() override;

    in_memory_metric_collector(const in_memory_metric_collector&) = delete;
    auto operator=(const in_memory_metric_collector&) -> in_memory_metric_collector& = delete;

    void report_metric(std::string_view name, std::chrono::nanoseconds value) override;

    /**
     * @brief Snapshot of every record, in reporting order
     */
    [[nodiscard]] auto records() const -> std::vector<record>;

    /**
     * @brief Number of values reported under @p name
     */
    [[nodiscard]] auto count(std::string_view name) const -> std::size_t;

    /**
     * @brief Most recent value reported under @p name
     */
    [[nodiscard]] auto last(std::string_view name) const -> std::optional<std::chrono::nanoseconds>;

    void clear();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_METRICS_METRIC_COLLECTOR_H
