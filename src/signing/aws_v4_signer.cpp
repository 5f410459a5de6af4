/**
 * @file aws_v4_signer.cpp
 * @brief Implementation of the SigV4 signers
 */

#include <kcenon/request_pipeline/signing/aws_v4_signer.h>
#include <kcenon/request_pipeline/chunked/chunk_encoder.h>
#include <kcenon/request_pipeline/chunked/chunked_encoded_publisher.h>
#include <kcenon/request_pipeline/chunked/sigv4_chunk_signature_extension.h>
#include <kcenon/request_pipeline/core/checksum.h>
#include <kcenon/request_pipeline/core/logging.h>
#include <kcenon/request_pipeline/signing/aws_v4_signing.h>
#include <kcenon/request_pipeline/signing/execution_attributes.h>
#include <kcenon/request_pipeline/signing/signing_clock.h>
#include <kcenon/request_pipeline/stream/collecting_subscriber.h>
#include <kcenon/request_pipeline/stream/in_memory_byte_publisher.h>

#include <charconv>
#include <chrono>

namespace kcenon::request_pipeline {

namespace {

struct sigv4_settings {
    std::shared_ptr<const aws_credentials_identity> credentials;
    std::string region;
    std::string service;
    std::chrono::system_clock::time_point signing_time;
};

template <typename T>
auto ready_future(T value) -> std::future<T> {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

auto check_credentials(const std::shared_ptr<const signing_identity>& identity)
    -> result<std::shared_ptr<const aws_credentials_identity>> {
    if (!identity) {
        return unexpected(error{error_code::missing_identity, "no identity to sign with"});
    }
    auto credentials = std::dynamic_pointer_cast<const aws_credentials_identity>(identity);
    if (!credentials) {
        return unexpected(error{error_code::unsupported_identity,
                                "SigV4 requires AWS credentials"});
    }
    if (credentials->is_expired()) {
        return unexpected(error{error_code::signing_failed, "credentials have expired"});
    }
    return credentials;
}

auto settings_from_properties(const sign_request& request) -> result<sigv4_settings> {
    if (!request.request) {
        return unexpected(error{error_code::invalid_configuration, "no request to sign"});
    }

    auto credentials = check_credentials(request.identity);
    if (!credentials) {
        return unexpected(credentials.error());
    }

    auto region = request.property(aws_v4_signer::region_name);
    if (!region) {
        return unexpected(error{error_code::missing_signer_property, "RegionName is not set"});
    }
    auto service = request.property(aws_v4_signer::service_signing_name);
    if (!service) {
        return unexpected(error{error_code::missing_signer_property,
                                "ServiceSigningName is not set"});
    }

    sigv4_settings settings;
    settings.credentials = credentials.value();
    settings.region = *region;
    settings.service = *service;

    auto clock = request.property(http_signer::signing_clock_property);
    settings.signing_time =
        (clock && *clock) ? (*clock)->now() : std::chrono::system_clock::now();
    return settings;
}

auto settings_from_attributes(const attribute_map& attributes) -> result<sigv4_settings> {
    auto identity = attributes.get_or(execution_attributes::aws_credentials,
                                      std::shared_ptr<const aws_credentials_identity>{});
    auto credentials = check_credentials(identity);
    if (!credentials) {
        return unexpected(credentials.error());
    }

    auto region = attributes.get(execution_attributes::signing_region);
    if (!region) {
        return unexpected(error{error_code::missing_signer_property, "SigningRegion is not set"});
    }
    auto service = attributes.get(execution_attributes::service_signing_name);
    if (!service) {
        return unexpected(error{error_code::missing_signer_property,
                                "ServiceSigningName is not set"});
    }

    sigv4_settings settings;
    settings.credentials = credentials.value();
    settings.region = *region;
    settings.service = *service;
    settings.signing_time =
        offset_signing_clock(attributes.get_or(execution_attributes::time_offset,
                                               std::chrono::seconds{0}))
            .now();
    return settings;
}

auto sign_with(const http_request& request,
               const sigv4_settings& settings,
               std::string_view payload_hash) -> aws_v4::header_signature {
    auto signature = aws_v4::sign_headers(request, *settings.credentials, settings.region,
                                          settings.service, settings.signing_time, payload_hash);
    RP_LOG_TRACE(log_category::signing,
                 "Authorization: " + signature.request.header("Authorization").value_or(""));
    return signature;
}

// Headers announcing an aws-chunked body. decoded_length is the payload size.
void prepare_streaming(http_request& request,
                       std::optional<uint64_t> decoded_length,
                       uint64_t chunk_size) {
    request.headers["Content-Encoding"] = "aws-chunked";
    request.headers["x-amz-content-sha256"] = std::string(aws_v4::streaming_payload);
    if (decoded_length) {
        request.headers["x-amz-decoded-content-length"] = std::to_string(*decoded_length);
        request.headers["Content-Length"] = std::to_string(chunk_encoder::framed_length(
            *decoded_length, chunk_size, aws_v4::chunk_signature_extension_length));
    } else {
        request.headers.erase("Content-Length");
    }
}

auto signed_chunk_body(std::shared_ptr<byte_publisher> body,
                       uint64_t chunk_size,
                       const aws_v4::header_signature& signature)
    -> result<std::shared_ptr<chunked_encoded_publisher>> {
    auto extension = std::make_shared<sigv4_chunk_signature_extension>(
        signature.signing_key, signature.amz_date, signature.scope, signature.signature);

    return chunked_encoded_publisher::builder()
        .with_source(std::move(body))
        .with_chunk_size(chunk_size)
        .add_extension(extension)
        .with_extension_length(aws_v4::chunk_signature_extension_length)
        .build();
}

auto parse_length(const std::string& text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto failing_body(error err) -> std::shared_ptr<byte_publisher> {
    auto body = std::make_shared<in_memory_byte_publisher>(std::vector<byte_chunk>{},
                                                           std::nullopt);
    body->set_failure(std::move(err));
    return body;
}

}  // namespace

// ============================================================================
// aws_v4_signer
// ============================================================================

auto aws_v4_signer::sign(const sign_request& request) -> result<signed_request> {
    auto settings = settings_from_properties(request);
    if (!settings) {
        return unexpected(settings.error());
    }

    http_request prepared = *request.request;
    if (settings.value().service == "s3") {
        prepared.headers["x-amz-content-sha256"] = std::string(aws_v4::empty_payload_hash);
    }

    auto signature = sign_with(prepared, settings.value(), aws_v4::empty_payload_hash);
    return signed_request{make_request(std::move(signature.request))};
}

auto aws_v4_signer::sign_async(const async_sign_request& request)
    -> std::future<result<async_signed_request>> {
    auto settings = settings_from_properties(request);
    if (!settings) {
        return ready_future(result<async_signed_request>(unexpected(settings.error())));
    }

    if (!request.payload) {
        auto signed_headers = sign(request);
        if (!signed_headers) {
            return ready_future(result<async_signed_request>(unexpected(signed_headers.error())));
        }
        return ready_future(result<async_signed_request>(
            async_signed_request{signed_headers.value().request, nullptr}));
    }

    if (request.property(chunk_encoding_enabled).value_or(false)) {
        const uint64_t size = request.property(chunk_size).value_or(default_chunk_size);
        if (size == 0) {
            return ready_future(result<async_signed_request>(
                unexpected(error{error_code::invalid_chunk_size, "chunk size must be positive"})));
        }

        http_request prepared = *request.request;
        prepare_streaming(prepared, request.payload->content_length(), size);

        auto signature = sign_with(prepared, settings.value(), aws_v4::streaming_payload);
        auto body = signed_chunk_body(request.payload, size, signature);
        if (!body) {
            return ready_future(result<async_signed_request>(unexpected(body.error())));
        }

        RP_LOG_DEBUG(log_category::signing, "Signed request for an aws-chunked body");
        return ready_future(result<async_signed_request>(
            async_signed_request{make_request(std::move(signature.request)), body.value()}));
    }

    // Hash the full payload, then replay the buffered bytes as the body
    return std::async(std::launch::async,
                      [to_sign = *request.request, payload = request.payload,
                       settings = settings.value()]() -> result<async_signed_request> {
        auto collector = std::make_shared<collecting_subscriber>();
        payload->subscribe(collector);
        if (auto received = collector->done()->wait(); !received) {
            return unexpected(received.error());
        }

        auto bytes = collector->bytes();
        const auto payload_hash = checksum::sha256(std::span<const std::byte>(bytes));

        http_request prepared = to_sign;
        prepared.headers["x-amz-content-sha256"] = payload_hash;
        auto signature = sign_with(prepared, settings, payload_hash);

        const uint64_t length = bytes.size();
        std::vector<byte_chunk> chunks;
        if (!bytes.empty()) {
            chunks.emplace_back(std::move(bytes));
        }
        auto replay = std::make_shared<in_memory_byte_publisher>(std::move(chunks), length);
        return async_signed_request{make_request(std::move(signature.request)), replay};
    });
}

// ============================================================================
// aws_v4_legacy_signer
// ============================================================================

aws_v4_legacy_signer::aws_v4_legacy_signer() : aws_v4_legacy_signer(options{}) {}

aws_v4_legacy_signer::aws_v4_legacy_signer(options opts) : options_(opts) {}

auto aws_v4_legacy_signer::sign(http_request_ptr request, attribute_map& attributes)
    -> result<http_request_ptr> {
    if (!request) {
        return unexpected(error{error_code::invalid_configuration, "no request to sign"});
    }
    auto settings = settings_from_attributes(attributes);
    if (!settings) {
        return unexpected(settings.error());
    }

    http_request prepared = *request;
    std::string payload_hash;
    if (options_.chunk_encoding) {
        if (options_.chunk_size == 0) {
            return unexpected(error{error_code::invalid_chunk_size, "chunk size must be positive"});
        }
        std::optional<uint64_t> decoded_length;
        if (auto length = prepared.header("Content-Length")) {
            decoded_length = parse_length(*length);
        }
        prepare_streaming(prepared, decoded_length, options_.chunk_size);
        payload_hash = std::string(aws_v4::streaming_payload);
    } else {
        payload_hash = prepared.header("x-amz-content-sha256")
                           .value_or(std::string(aws_v4::empty_payload_hash));
    }

    auto signature = sign_with(prepared, settings.value(), payload_hash);
    return make_request(std::move(signature.request));
}

auto aws_v4_legacy_signer::sign_async_request_body(http_request_ptr signed_request,
                                                   std::shared_ptr<byte_publisher> body,
                                                   attribute_map& attributes)
    -> std::shared_ptr<byte_publisher> {
    if (!options_.chunk_encoding || !body) {
        return body;
    }

    auto settings = settings_from_attributes(attributes);
    if (!settings) {
        return failing_body(settings.error());
    }

    constexpr std::string_view marker = "Signature=";
    auto authorization = signed_request ? signed_request->header("Authorization") : std::nullopt;
    auto amz_date = signed_request ? signed_request->header("X-Amz-Date") : std::nullopt;
    const auto at = authorization ? authorization->rfind(marker) : std::string::npos;
    if (at == std::string::npos || !amz_date || amz_date->size() < 8) {
        RP_LOG_ERROR(log_category::signing, "Request body signed before the request headers");
        return failing_body(error{error_code::signing_failed, "request is not SigV4 signed"});
    }

    aws_v4::header_signature seed;
    seed.signature = authorization->substr(at + marker.size());
    seed.amz_date = *amz_date;
    const auto date_stamp = amz_date->substr(0, 8);
    seed.scope = aws_v4::credential_scope(date_stamp, settings.value().region,
                                          settings.value().service);
    seed.signing_key = aws_v4::derive_signing_key(settings.value().credentials->secret_access_key,
                                                  date_stamp, settings.value().region,
                                                  settings.value().service);

    auto framed = signed_chunk_body(std::move(body), options_.chunk_size, seed);
    if (!framed) {
        return failing_body(framed.error());
    }
    return framed.value();
}

}  // namespace kcenon::request_pipeline
