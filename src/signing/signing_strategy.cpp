/**
 * @file signing_strategy.cpp
 * @brief Implementation of resolve_signing_strategy
 */

#include <kcenon/request_pipeline/signing/signing_strategy.h>

namespace kcenon::request_pipeline {

auto resolve_signing_strategy(const request_execution_context& context) -> signing_strategy {
    auto body = context.request_provider();

    if (auto scheme = context.auth_scheme(); scheme && scheme->signer) {
        if (body) {
            return capability_async{std::move(scheme), std::move(body)};
        }
        return capability_sync{std::move(scheme)};
    }

    auto signer = context.signer();
    if (!signer) {
        return no_op{};
    }

    if (body) {
        if (auto body_signer = std::dynamic_pointer_cast<async_request_body_signer>(signer)) {
            return legacy_async{std::move(body_signer), nullptr, std::move(body)};
        }
    }
    if (auto payload_signer = std::dynamic_pointer_cast<async_signer>(signer)) {
        return legacy_async{nullptr, std::move(payload_signer), std::move(body)};
    }
    return legacy_sync{std::move(signer)};
}

namespace {

struct name_of {
    auto operator()(const capability_sync&) const -> std::string_view { return "capability_sync"; }
    auto operator()(const capability_async&) const -> std::string_view {
        return "capability_async";
    }
    auto operator()(const legacy_sync&) const -> std::string_view { return "legacy_sync"; }
    auto operator()(const legacy_async&) const -> std::string_view { return "legacy_async"; }
    auto operator()(const no_op&) const -> std::string_view { return "no_op"; }
};

}  // namespace

auto strategy_name(const signing_strategy& strategy) -> std::string_view {
    return std::visit(name_of{}, strategy);
}

}  // namespace kcenon::request_pipeline
