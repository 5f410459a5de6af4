/**
 * @file aws_v4_signing.cpp
 * @brief Implementation of the SigV4 building blocks
 */

#include <kcenon/request_pipeline/signing/aws_v4_signing.h>
#include <kcenon/request_pipeline/core/checksum.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace kcenon::request_pipeline::aws_v4 {

namespace {

constexpr std::array<std::string_view, 5> unsigned_headers = {
    "connection", "expect", "transfer-encoding", "user-agent", "x-amzn-trace-id"};

auto as_key(std::string_view text) -> std::span<const uint8_t> {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

auto to_lower(std::string_view text) -> std::string {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// Leading/trailing whitespace removed, inner runs of spaces collapsed
auto canonical_header_value(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (char c : value) {
        if (c == ' ' || c == '\t') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

auto format_utc(std::chrono::system_clock::time_point instant, const char* pattern)
    -> std::string {
    auto time_t = std::chrono::system_clock::to_time_t(instant);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

}  // namespace

// ============================================================================
// Encoding Utilities
// ============================================================================

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto format_amz_date(std::chrono::system_clock::time_point instant) -> std::string {
    return format_utc(instant, "%Y%m%dT%H%M%SZ");
}

auto format_date_stamp(std::chrono::system_clock::time_point instant) -> std::string {
    return format_utc(instant, "%Y%m%d");
}

// ============================================================================
// Request Signature
// ============================================================================

auto credential_scope(std::string_view date_stamp,
                      std::string_view region,
                      std::string_view service) -> std::string {
    std::string scope;
    scope.append(date_stamp).append("/").append(region).append("/").append(service);
    scope.append("/aws4_request");
    return scope;
}

auto canonical_query_string(const std::vector<std::pair<std::string, std::string>>& params)
    -> std::string {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(params.size());
    for (const auto& [name, value] : params) {
        encoded.emplace_back(url_encode(name), url_encode(value));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string query;
    for (const auto& [name, value] : encoded) {
        if (!query.empty()) {
            query += '&';
        }
        query += name;
        query += '=';
        query += value;
    }
    return query;
}

auto build_canonical_request(const http_request& request, std::string_view payload_hash)
    -> canonical_request {
    // Create canonical headers (sorted by lowercase key)
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [name, value] : request.headers) {
        auto lower_key = to_lower(name);
        if (std::find(unsigned_headers.begin(), unsigned_headers.end(), lower_key) !=
            unsigned_headers.end()) {
            continue;
        }
        sorted_headers[lower_key] = canonical_header_value(value);
    }

    std::ostringstream canonical_headers;
    std::ostringstream signed_headers_builder;
    bool first = true;
    for (const auto& [k, v] : sorted_headers) {
        canonical_headers << k << ":" << v << "\n";
        if (!first) signed_headers_builder << ";";
        signed_headers_builder << k;
        first = false;
    }

    canonical_request out;
    out.signed_headers = signed_headers_builder.str();

    std::ostringstream text;
    text << request.method << "\n";
    text << (request.encoded_path.empty() ? "/" : request.encoded_path) << "\n";
    text << canonical_query_string(request.query_params) << "\n";
    text << canonical_headers.str() << "\n";
    text << out.signed_headers << "\n";
    text << payload_hash;
    out.text = text.str();
    return out;
}

auto build_string_to_sign(std::string_view amz_date,
                          std::string_view scope,
                          std::string_view canonical_request_text) -> std::string {
    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << scope << "\n";
    string_to_sign << checksum::sha256(canonical_request_text);
    return string_to_sign.str();
}

auto derive_signing_key(std::string_view secret_access_key,
                        std::string_view date_stamp,
                        std::string_view region,
                        std::string_view service) -> std::vector<uint8_t> {
    const std::string secret = "AWS4" + std::string(secret_access_key);
    auto k_date = checksum::hmac_sha256(as_key(secret), date_stamp);
    auto k_region = checksum::hmac_sha256(k_date, region);
    auto k_service = checksum::hmac_sha256(k_region, service);
    return checksum::hmac_sha256(k_service, "aws4_request");
}

auto compute_signature(std::span<const uint8_t> signing_key, std::string_view string_to_sign)
    -> std::string {
    return checksum::to_hex(checksum::hmac_sha256(signing_key, string_to_sign));
}

auto sign_headers(const http_request& request,
                  const aws_credentials_identity& credentials,
                  std::string_view region,
                  std::string_view service,
                  std::chrono::system_clock::time_point signing_time,
                  std::string_view payload_hash) -> header_signature {
    header_signature out;
    out.request = request;
    out.amz_date = format_amz_date(signing_time);
    const auto date_stamp = format_date_stamp(signing_time);
    out.scope = credential_scope(date_stamp, region, service);

    auto& headers = out.request.headers;
    headers.erase("Authorization");
    if (headers.find("Host") == headers.end()) {
        headers["Host"] = request.host_header();
    }
    headers["X-Amz-Date"] = out.amz_date;
    if (credentials.session_token.has_value()) {
        headers["X-Amz-Security-Token"] = credentials.session_token.value();
    }

    auto canonical = build_canonical_request(out.request, payload_hash);
    auto string_to_sign = build_string_to_sign(out.amz_date, out.scope, canonical.text);

    out.signing_key =
        derive_signing_key(credentials.secret_access_key, date_stamp, region, service);
    out.signature = compute_signature(out.signing_key, string_to_sign);

    // Build authorization header
    std::ostringstream auth_header;
    auth_header << algorithm << " ";
    auth_header << "Credential=" << credentials.access_key_id << "/" << out.scope << ", ";
    auth_header << "SignedHeaders=" << canonical.signed_headers << ", ";
    auth_header << "Signature=" << out.signature;
    headers["Authorization"] = auth_header.str();

    return out;
}

// ============================================================================
// Chunk Signatures
// ============================================================================

auto build_chunk_string_to_sign(std::string_view amz_date,
                                std::string_view scope,
                                std::string_view previous_signature,
                                std::span<const std::byte> chunk) -> std::string {
    std::ostringstream string_to_sign;
    string_to_sign << chunk_algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << scope << "\n";
    string_to_sign << previous_signature << "\n";
    string_to_sign << empty_payload_hash << "\n";
    string_to_sign << checksum::sha256(chunk);
    return string_to_sign.str();
}

}  // namespace kcenon::request_pipeline::aws_v4
