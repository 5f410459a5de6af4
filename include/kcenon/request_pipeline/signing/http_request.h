/**
 * @file http_request.h
 * @brief Outbound HTTP request as seen by signers
 */

#ifndef KCENON_REQUEST_PIPELINE_SIGNING_HTTP_REQUEST_H
#define KCENON_REQUEST_PIPELINE_SIGNING_HTTP_REQUEST_H

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::request_pipeline {

/**
 * @brief Case-insensitive ordering for header names
 */
struct header_name_less {
    using is_transparent = void;

    auto operator()(std::string_view lhs, std::string_view rhs) const -> bool {
        return std::lexicographical_compare(
            lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
            [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
    }
};

using header_map = std::map<std::string, std::string, header_name_less>;

/**
 * @brief Immutable-by-convention HTTP request
 *
 * Pipeline stages share requests as http_request_ptr and produce modified
 * copies through the with_* helpers rather than editing in place.
 */
struct http_request {
    std::string method = "GET";
    std::string protocol = "https";
    std::string host;
    std::optional<int> port;

    /// Already URI-encoded path
    std::string encoded_path = "/";

    /// Decoded query parameters, in insertion order
    std::vector<std::pair<std::string, std::string>> query_params;

    header_map headers;

    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string> {
        auto it = headers.find(name);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto has_header(std::string_view name) const -> bool {
        return headers.find(name) != headers.end();
    }

    /**
     * @brief Copy with @p name set to @p value
     */
    [[nodiscard]] auto with_header(std::string name, std::string value) const -> http_request {
        http_request copy = *this;
        copy.headers[std::move(name)] = std::move(value);
        return copy;
    }

    /**
     * @brief Host header value, including a non-default port
     */
    [[nodiscard]] auto host_header() const -> std::string {
        if (!port) {
            return host;
        }
        const bool default_port = (protocol == "https" && *port == 443) ||
                                  (protocol == "http" && *port == 80);
        return default_port ? host : host + ":" + std::to_string(*port);
    }
};

using http_request_ptr = std::shared_ptr<const http_request>;

[[nodiscard]] inline auto make_request(http_request request) -> http_request_ptr {
    return std::make_shared<const http_request>(std::move(request));
}

}  // namespace kcenon::request_pipeline

#endif  // KCENON_REQUEST_PIPELINE_SIGNING_HTTP_REQUEST_H
