/**
 * @file bench_pipeline_operations.cpp
 * @brief Benchmarks for body splitting, chunked framing and checksums
 */

#include <benchmark/benchmark.h>

#include <kcenon/request_pipeline/chunked/chunked_encoded_publisher.h>
#include <kcenon/request_pipeline/chunked/crc32_chunk_extension.h>
#include <kcenon/request_pipeline/chunked/sigv4_chunk_signature_extension.h>
#include <kcenon/request_pipeline/core/checksum.h>
#include <kcenon/request_pipeline/signing/aws_v4_signing.h>
#include <kcenon/request_pipeline/stream/in_memory_byte_publisher.h>
#include <kcenon/request_pipeline/stream/splitting_publisher.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::request_pipeline::benchmark {

/**
 * @brief Benchmark for splitting_publisher with various body and part sizes
 */
static void BM_SplittingPublisher_Split(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<std::size_t>(state.range(1));

    auto body = test_data_generator::generate_random_body(body_size, 42);
    auto source = in_memory_byte_publisher::from_string(body, sizes::source_buffer);

    std::size_t parts = 0;
    for (auto _ : state) {
        auto splitter = splitting_publisher::builder()
                            .with_source(source)
                            .with_chunk_size(part_size)
                            .with_max_memory_usage(4 * part_size)
                            .build();
        if (!splitter) {
            state.SkipWithError("Failed to build splitter");
            return;
        }

        auto drainer = std::make_shared<part_drainer>();
        splitter.value()->subscribe(drainer);
        if (!splitter.value()->result_signal()->wait()) {
            state.SkipWithError("Splitting failed");
            return;
        }
        ::benchmark::DoNotOptimize(drainer->wait_all());
        parts = drainer->part_count();
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(parts) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for chunked framing with a running CRC32 extension
 */
static void BM_ChunkedEncoding_Crc32(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto body = test_data_generator::generate_random_body(body_size, 42);
    auto source = in_memory_byte_publisher::from_string(body, sizes::source_buffer);

    auto framed = chunked_encoded_publisher::builder()
                      .with_source(source)
                      .with_chunk_size(chunk_size)
                      .add_extension(std::make_shared<crc32_chunk_extension>())
                      .build();
    if (!framed) {
        state.SkipWithError("Failed to build chunked publisher");
        return;
    }

    for (auto _ : state) {
        auto collector = std::make_shared<collecting_subscriber>();
        framed.value()->subscribe(collector);
        if (!collector->done()->wait()) {
            state.SkipWithError("Framing failed");
            return;
        }
        ::benchmark::DoNotOptimize(collector->chunk_count());
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for aws-chunked framing with chained chunk signatures
 */
static void BM_ChunkedEncoding_SigV4(::benchmark::State& state) {
    const auto body_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto body = test_data_generator::generate_random_body(body_size, 42);
    auto source = in_memory_byte_publisher::from_string(body, sizes::source_buffer);

    const std::string amz_date = "20130524T000000Z";
    auto extension = std::make_shared<sigv4_chunk_signature_extension>(
        aws_v4::derive_signing_key("wJalrXUtnFEMI/K7MDENG/bPxRfiCYEXAMPLEKEY", "20130524",
                                   "us-east-1", "s3"),
        amz_date, aws_v4::credential_scope("20130524", "us-east-1", "s3"),
        std::string(64, '0'));

    auto framed = chunked_encoded_publisher::builder()
                      .with_source(source)
                      .with_chunk_size(chunk_size)
                      .add_extension(extension)
                      .with_extension_length(aws_v4::chunk_signature_extension_length)
                      .build();
    if (!framed) {
        state.SkipWithError("Failed to build chunked publisher");
        return;
    }

    for (auto _ : state) {
        auto collector = std::make_shared<collecting_subscriber>();
        framed.value()->subscribe(collector);
        if (!collector->done()->wait()) {
            state.SkipWithError("Framing failed");
            return;
        }
        ::benchmark::DoNotOptimize(collector->chunk_count());
    }

    state.SetBytesProcessed(static_cast<int64_t>(body_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for CRC32 checksum calculation
 */
static void BM_Checksum_CRC32(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_body(data_size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(as_bytes(data));
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for SHA-256 hash calculation
 */
static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = test_data_generator::generate_random_body(data_size, 42);

    for (auto _ : state) {
        auto hash = checksum::sha256(as_bytes(data));
        ::benchmark::DoNotOptimize(hash);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                           static_cast<int64_t>(state.iterations()));
}

// Register benchmarks with various sizes

BENCHMARK(BM_SplittingPublisher_Split)
    ->Args({static_cast<int64_t>(sizes::medium_body), static_cast<int64_t>(sizes::min_part)})
    ->Args({static_cast<int64_t>(sizes::large_body), static_cast<int64_t>(sizes::min_part)})
    ->Args({static_cast<int64_t>(sizes::large_body), static_cast<int64_t>(sizes::default_part)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkedEncoding_Crc32)
    ->Args({static_cast<int64_t>(sizes::medium_body), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_body), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkedEncoding_SigV4)
    ->Args({static_cast<int64_t>(sizes::medium_body), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_body), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_CRC32)
    ->Arg(static_cast<int64_t>(sizes::small_body))
    ->Arg(static_cast<int64_t>(sizes::medium_body))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(static_cast<int64_t>(sizes::small_body))
    ->Arg(static_cast<int64_t>(sizes::medium_body))
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::request_pipeline::benchmark
