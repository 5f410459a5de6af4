/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and result<T>
 */

#include <gtest/gtest.h>

#include <kcenon/request_pipeline/core/types.h>

#include <memory>
#include <string>

namespace kcenon::request_pipeline::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Configuration errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::invalid_chunk_size), -100);
    EXPECT_EQ(static_cast<int>(error_code::missing_signer_property), -103);

    // Stream errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::upstream_failed), -120);
    EXPECT_EQ(static_cast<int>(error_code::stream_closed), -124);

    // Signing errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::signing_failed), -140);
    EXPECT_EQ(static_cast<int>(error_code::unsupported_identity), -142);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::content_length_mismatch), "content length mismatch");
    EXPECT_STREQ(to_string(error_code::missing_identity), "missing identity");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, ErrorFromCodeUsesDefaultMessage) {
    error err(error_code::stream_cancelled);

    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "stream cancelled");
    EXPECT_FALSE(static_cast<bool>(error{}));
}

// =============================================================================
// result<T> Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;

    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected(error{error_code::signing_failed, "expired"});

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::signing_failed);
    EXPECT_EQ(r.error().message, "expired");
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r = std::make_unique<int>(7);

    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    result<void> failed = unexpected(error{error_code::internal_error});

    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "internal error");
}

}  // namespace kcenon::request_pipeline::test
