/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <limits>
#include <random>

namespace kcenon::request_pipeline::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_body(std::size_t size, uint32_t seed) -> std::string {
    std::string data(size, '\0');

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& c : data) {
        c = static_cast<char>(dis(gen));
    }

    return data;
}

// part_drainer implementation

void part_drainer::on_subscribe(std::shared_ptr<subscription> s) {
    s->request(std::numeric_limits<uint64_t>::max());
}

void part_drainer::on_next(std::shared_ptr<part_body> part) {
    auto reader = std::make_shared<collecting_subscriber>();
    readers_.push_back(reader);
    part->subscribe(reader);
}

void part_drainer::on_error(const error& /*err*/) {}

void part_drainer::on_complete() {}

auto part_drainer::wait_all() -> uint64_t {
    uint64_t total = 0;
    for (const auto& reader : readers_) {
        if (!reader->done()->wait()) {
            return 0;
        }
        total += reader->bytes().size();
    }
    return total;
}

}  // namespace kcenon::request_pipeline::benchmark
