/**
 * @file test_chunk_extensions.cpp
 * @brief Unit tests for the CRC32 and SigV4 chunk extensions
 */

#include <gtest/gtest.h>

#include <kcenon/request_pipeline/chunked/crc32_chunk_extension.h>
#include <kcenon/request_pipeline/chunked/sigv4_chunk_signature_extension.h>
#include <kcenon/request_pipeline/core/checksum.h>
#include <kcenon/request_pipeline/signing/aws_v4_signing.h>

#include <string>

namespace kcenon::request_pipeline::test {

// =============================================================================
// crc32_chunk_extension
// =============================================================================

class Crc32ChunkExtensionTest : public ::testing::Test {};

TEST_F(Crc32ChunkExtensionTest, RunningValueAcrossChunks) {
    crc32_chunk_extension extension;

    auto first = extension.compute(as_bytes("1234"));
    auto second = extension.compute(as_bytes("56789"));

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->name, "chunk-crc32");
    EXPECT_EQ(second->value, "cbf43926");
    EXPECT_EQ(extension.current(), 0xCBF43926u);
}

TEST_F(Crc32ChunkExtensionTest, EmptyChunkRepeatsCurrentValue) {
    crc32_chunk_extension extension;
    extension.compute(as_bytes("123456789"));

    auto final_value = extension.compute({});

    ASSERT_TRUE(final_value.has_value());
    EXPECT_EQ(final_value->value, "cbf43926");
}

TEST_F(Crc32ChunkExtensionTest, ResetReproducesSequence) {
    crc32_chunk_extension extension("x-crc");

    auto a1 = extension.compute(as_bytes("abc"));
    auto b1 = extension.compute(as_bytes("def"));
    extension.reset();
    auto a2 = extension.compute(as_bytes("abc"));
    auto b2 = extension.compute(as_bytes("def"));

    EXPECT_EQ(a1, a2);
    EXPECT_EQ(b1, b2);
    EXPECT_EQ(a1->name, "x-crc");
    EXPECT_EQ(a1->value, "352441c2");
}

TEST_F(Crc32ChunkExtensionTest, LeadingZerosArePreserved) {
    crc32_chunk_extension extension;

    auto annotation = extension.compute({});

    ASSERT_TRUE(annotation.has_value());
    EXPECT_EQ(annotation->value, "00000000");
}

// =============================================================================
// sigv4_chunk_signature_extension
// =============================================================================

class SigV4ChunkSignatureExtensionTest : public ::testing::Test {
protected:
    static constexpr const char* seed =
        "4f232c4386841ef735655705268965c44a0e4690baa4adea153f7db9fa80a0a9";

    auto make_extension() -> sigv4_chunk_signature_extension {
        auto key = aws_v4::derive_signing_key("wJalrXUtnFEMI/K7MDENG/bPxRfiCYEXAMPLEKEY",
                                              "20130524", "us-east-1", "s3");
        return sigv4_chunk_signature_extension(
            std::move(key), "20130524T000000Z", "20130524/us-east-1/s3/aws4_request", seed);
    }
};

TEST_F(SigV4ChunkSignatureExtensionTest, ChainsFromSeedSignature) {
    auto extension = make_extension();
    const std::string full(65536, 'a');
    const std::string tail(1024, 'a');

    auto first = extension.compute(as_bytes(full));
    auto second = extension.compute(as_bytes(tail));
    auto last = extension.compute({});

    ASSERT_TRUE(first && second && last);
    EXPECT_EQ(first->name, "chunk-signature");
    EXPECT_EQ(first->value, "ad80c730a21e5b8d04586a2213dd63b9a0e99e0e2307b0ade35a65485a288648");
    EXPECT_EQ(second->value, "0055627c9e194cb4542bae2aa5492e3c1575bbb81b612b7d234b86a503ef5497");
    EXPECT_EQ(last->value, "b6c6ea8a5354eaf15b3cb7646744f4275b71ea724fed81ceb9323e279d449df9");
}

TEST_F(SigV4ChunkSignatureExtensionTest, ResetReturnsToSeed) {
    auto extension = make_extension();
    const std::string full(65536, 'a');

    auto before = extension.compute(as_bytes(full));
    extension.reset();
    auto after = extension.compute(as_bytes(full));

    EXPECT_EQ(before, after);
    EXPECT_EQ(extension.seed_signature(), seed);
}

TEST_F(SigV4ChunkSignatureExtensionTest, AnnotationLengthIsFixed) {
    auto extension = make_extension();

    auto annotation = extension.compute(as_bytes("x"));

    ASSERT_TRUE(annotation.has_value());
    EXPECT_EQ(1 + annotation->name.size() + 1 + annotation->value.size(),
              aws_v4::chunk_signature_extension_length);
}

}  // namespace kcenon::request_pipeline::test
