/**
 * @file in_memory_byte_publisher.cpp
 * @brief Implementation of in_memory_byte_publisher
 */

#include <kcenon/request_pipeline/stream/in_memory_byte_publisher.h>
#include <kcenon/request_pipeline/stream/simple_publisher.h>

#include <algorithm>

namespace kcenon::request_pipeline {

in_memory_byte_publisher::in_memory_byte_publisher(std::vector<byte_chunk> chunks,
                                                   std::optional<uint64_t> declared_length)
    : chunks_(std::move(chunks)), declared_length_(declared_length) {}

auto in_memory_byte_publisher::from_string(std::string_view text,
                                           std::size_t buffer_size,
                                           bool length_known)
    -> std::shared_ptr<in_memory_byte_publisher> {
    auto whole = byte_chunk::from_string(text);

    std::vector<byte_chunk> chunks;
    if (buffer_size == 0 || buffer_size >= whole.size()) {
        if (!whole.empty()) {
            chunks.push_back(whole);
        }
    } else {
        for (std::size_t offset = 0; offset < whole.size(); offset += buffer_size) {
            chunks.push_back(whole.slice(offset, buffer_size));
        }
    }

    std::optional<uint64_t> length;
    if (length_known) {
        length = static_cast<uint64_t>(text.size());
    }
    return std::make_shared<in_memory_byte_publisher>(std::move(chunks), length);
}

void in_memory_byte_publisher::set_failure(error err) {
    failure_ = std::move(err);
}

auto in_memory_byte_publisher::content_length() const -> std::optional<uint64_t> {
    return declared_length_;
}

void in_memory_byte_publisher::subscribe(std::shared_ptr<byte_subscriber> s) {
    auto replay = simple_publisher<byte_chunk>::create();
    for (const auto& chunk : chunks_) {
        replay->send(chunk);
    }
    if (failure_) {
        replay->fail(*failure_);
    } else {
        replay->complete();
    }
    replay->subscribe(std::move(s));
}

}  // namespace kcenon::request_pipeline
