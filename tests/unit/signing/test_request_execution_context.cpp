/**
 * @file test_request_execution_context.cpp
 * @brief Unit tests for request_execution_context
 */

#include <gtest/gtest.h>

#include <kcenon/request_pipeline/signing/request_execution_context.h>
#include <kcenon/request_pipeline/stream/in_memory_byte_publisher.h>

namespace kcenon::request_pipeline::test {

class RequestExecutionContextTest : public ::testing::Test {
protected:
    request_execution_context context_;
};

TEST_F(RequestExecutionContextTest, DefaultState) {
    EXPECT_EQ(context_.auth_scheme(), nullptr);
    EXPECT_EQ(context_.signer(), nullptr);
    EXPECT_EQ(context_.request_provider(), nullptr);
    EXPECT_EQ(context_.metrics(), nullptr);
    EXPECT_EQ(context_.interceptor().request, nullptr);
    EXPECT_EQ(context_.time_offset(), std::chrono::seconds(0));
}

TEST_F(RequestExecutionContextTest, AuthSchemeLivesInAttributes) {
    auto scheme = std::make_shared<const selected_auth_scheme>();
    context_.set_auth_scheme(scheme);

    EXPECT_EQ(context_.auth_scheme(), scheme);
    EXPECT_EQ(context_.attributes().get(execution_attributes::selected_scheme), scheme);

    context_.set_auth_scheme(nullptr);
    EXPECT_FALSE(context_.attributes().contains(execution_attributes::selected_scheme));
}

TEST_F(RequestExecutionContextTest, InterceptorUpdatesAreIndependent) {
    auto request = make_request(http_request{});
    auto body = in_memory_byte_publisher::from_string("body");

    context_.update_interceptor_request(request);
    EXPECT_EQ(context_.interceptor().request, request);
    EXPECT_EQ(context_.interceptor().async_request_body, nullptr);

    context_.update_interceptor_body(body);
    EXPECT_EQ(context_.interceptor().request, request);
    EXPECT_EQ(context_.interceptor().async_request_body, body);
}

TEST_F(RequestExecutionContextTest, TimeOffsetUpdates) {
    context_.update_time_offset(std::chrono::seconds(-900));
    EXPECT_EQ(context_.time_offset(), std::chrono::seconds(-900));
}

}  // namespace kcenon::request_pipeline::test
