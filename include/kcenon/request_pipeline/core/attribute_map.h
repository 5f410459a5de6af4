/**
 * @file attribute_map.h
 * @brief Thread-safe map of typed attributes
 *
 * Backs both signer properties (immutable per sign request once built) and
 * execution attributes (shared, mutated by the signing stage).
 */

#ifndef KCENON_REQUEST_PIPELINE_CORE_ATTRIBUTE_MAP_H
#define KCENON_REQUEST_PIPELINE_CORE_ATTRIBUTE_MAP_H

#include <any>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kcenon::request_pipeline {

/**
 * @brief Named key carrying the value type of an attribute
 */
template <typename T>
class attribute_key {
public:
    using value_type = T;

    constexpr explicit attribute_key(std::string_view name) : name_(name) {}

    [[nodiscard]] constexpr auto name() const -> std::string_view { return name_; }

private:
    std::string_view name_;
};

/**
 * @brief Map from attribute_key<T> to values of T
 *
 * @code
 * static constexpr attribute_key<std::string> region{"SigningRegion"};
 *
 * attribute_map attributes;
 * attributes.put(region, std::string("us-east-1"));
 * auto value = attributes.get(region);  // std::optional<std::string>
 * @endcode
 */
class attribute_map {
public:
    attribute_map() = default;

    attribute_map(const attribute_map& other) {
        std::lock_guard<std::mutex> lock(other.mutex_);
        values_ = other.values_;
    }

    auto operator=(const attribute_map& other) -> attribute_map& {
        if (this != &other) {
            std::scoped_lock lock(mutex_, other.mutex_);
            values_ = other.values_;
        }
        return *this;
    }

    template <typename T>
    auto put(const attribute_key<T>& key, T value) -> attribute_map& {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[std::string(key.name())] = std::move(value);
        return *this;
    }

    /**
     * @brief Put only when the key is absent
     * @return true if the value was stored
     */
    template <typename T>
    auto put_if_absent(const attribute_key<T>& key, T value) -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.try_emplace(std::string(key.name()), std::move(value)).second;
    }

    template <typename T>
    [[nodiscard]] auto get(const attribute_key<T>& key) const -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(std::string(key.name()));
        if (it == values_.end()) {
            return std::nullopt;
        }
        if (const auto* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    template <typename T>
    [[nodiscard]] auto get_or(const attribute_key<T>& key, T fallback) const -> T {
        auto value = get(key);
        return value ? std::move(*value) : std::move(fallback);
    }

    template <typename T>
    [[nodiscard]] auto contains(const attribute_key<T>& key) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(std::string(key.name())) != 0;
    }

    template <typename T>
    auto remove(const attribute_key<T>& key) -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.erase(std::string(key.name())) != 0;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

    /**
     * @brief Copy every entry of @p other into this map, overwriting
     */
    void merge(const attribute_map& other) {
        if (this == &other) {
            return;
        }
        std::scoped_lock lock(mutex_, other.mutex_);
        for (const auto& [name, value] : other.values_) {
            values_[name] = value;
        }
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::any> values_;
};

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_CORE_ATTRIBUTE_MAP_H
