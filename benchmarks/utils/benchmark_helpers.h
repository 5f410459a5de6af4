/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_REQUEST_PIPELINE_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_REQUEST_PIPELINE_BENCHMARKS_BENCHMARK_HELPERS_H

#include <kcenon/request_pipeline/stream/collecting_subscriber.h>
#include <kcenon/request_pipeline/stream/splitting_publisher.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::request_pipeline::benchmark {

/**
 * @brief Helper class for generating request bodies
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return String holding random bytes
     */
    static auto generate_random_body(std::size_t size, uint32_t seed = 0) -> std::string;
};

/**
 * @brief Parts subscriber that drains every part into a collecting_subscriber
 */
class part_drainer : public subscriber<std::shared_ptr<part_body>> {
public:
    void on_subscribe(std::shared_ptr<subscription> s) override;
    void on_next(std::shared_ptr<part_body> part) override;
    void on_error(const error& err) override;
    void on_complete() override;

    /**
     * @brief Wait for every part received so far
     * @return Total bytes read, or 0 if a part failed
     */
    auto wait_all() -> uint64_t;

    [[nodiscard]] auto part_count() const -> std::size_t { return readers_.size(); }

private:
    std::vector<std::shared_ptr<collecting_subscriber>> readers_;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_body = 256 * KB;
constexpr std::size_t medium_body = 8 * MB;
constexpr std::size_t large_body = 64 * MB;

// Buffer size of the in-memory source
constexpr std::size_t source_buffer = 64 * KB;

constexpr std::size_t min_part = 1 * MB;
constexpr std::size_t default_part = 8 * MB;

// aws-chunked chunk sizes
constexpr std::size_t min_chunk = 8 * KB;
constexpr std::size_t default_chunk = 128 * KB;
}  // namespace sizes

}  // namespace kcenon::request_pipeline::benchmark

#endif  // KCENON_REQUEST_PIPELINE_BENCHMARKS_BENCHMARK_HELPERS_H
