/**
 * @file byte_chunk.h
 * @brief Immutable, shareable byte buffer for streamed request bodies
 *
 * A byte_chunk is a view over reference-counted storage. Slicing shares the
 * storage, so carving a buffer into parts never copies the payload.
 */

#ifndef KCENON_REQUEST_PIPELINE_STREAM_BYTE_CHUNK_H
#define KCENON_REQUEST_PIPELINE_STREAM_BYTE_CHUNK_H

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Shared immutable byte buffer
 */
class byte_chunk {
public:
    byte_chunk() = default;

    explicit byte_chunk(std::vector<std::byte> data)
        : storage_(std::make_shared<const std::vector<std::byte>>(std::move(data))),
          offset_(0),
          length_(storage_->size()) {}

    /**
     * @brief Copy the characters of a string into a new chunk
     */
    [[nodiscard]] static auto from_string(std::string_view text) -> byte_chunk {
        std::vector<std::byte> data(text.size());
        if (!text.empty()) {
            std::memcpy(data.data(), text.data(), text.size());
        }
        return byte_chunk(std::move(data));
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return length_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return length_ == 0; }

    [[nodiscard]] auto data() const noexcept -> const std::byte* {
        return storage_ ? storage_->data() + offset_ : nullptr;
    }

    [[nodiscard]] auto span() const noexcept -> std::span<const std::byte> {
        return {data(), length_};
    }

    /**
     * @brief View of @p length bytes starting at @p offset, sharing storage
     *
     * Out-of-range requests are clamped to the chunk bounds.
     */
    [[nodiscard]] auto slice(std::size_t offset, std::size_t length) const -> byte_chunk {
        byte_chunk out;
        out.storage_ = storage_;
        out.offset_ = offset_ + std::min(offset, length_);
        out.length_ = std::min(length, length_ - std::min(offset, length_));
        return out;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return std::string(reinterpret_cast<const char*>(data()), length_);
    }

private:
    std::shared_ptr<const std::vector<std::byte>> storage_;
    std::size_t offset_ = 0;
    std::size_t length_ = 0;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_STREAM_BYTE_CHUNK_H
