/**
 * @file test_chunk_encoder.cpp
 * @brief Unit tests for chunk_encoder framing and length prediction
 */

#include <gtest/gtest.h>

#include <kcenon/request_pipeline/chunked/chunk_encoder.h>
#include <kcenon/request_pipeline/chunked/crc32_chunk_extension.h>
#include <kcenon/request_pipeline/core/checksum.h>
#include <kcenon/request_pipeline/signing/aws_v4_signing.h>

#include <string>
#include <vector>

namespace kcenon::request_pipeline::test {

namespace {

/// Extension with a fixed annotation, or none
class constant_extension : public chunk_extension {
public:
    explicit constant_extension(std::optional<chunk_annotation> annotation)
        : annotation_(std::move(annotation)) {}

    auto compute(std::span<const std::byte>) -> std::optional<chunk_annotation> override {
        ++calls;
        return annotation_;
    }

    int calls = 0;

private:
    std::optional<chunk_annotation> annotation_;
};

}  // namespace

class ChunkEncoderTest : public ::testing::Test {};

// =============================================================================
// Framing
// =============================================================================

TEST_F(ChunkEncoderTest, EncodeChunk_NoExtensions) {
    chunk_encoder encoder;

    EXPECT_EQ(encoder.encode_chunk(as_bytes("hello")).to_string(), "5\r\nhello\r\n");
    EXPECT_EQ(encoder.encode_final_chunk().to_string(), "0\r\n\r\n");
}

TEST_F(ChunkEncoderTest, EncodeChunk_LowercaseHexLength) {
    chunk_encoder encoder;
    const std::string payload(255, 'x');

    auto framed = encoder.encode_chunk(as_bytes(payload)).to_string();

    EXPECT_EQ(framed.substr(0, 4), "ff\r\n");
    EXPECT_EQ(framed.size(), 2u + 2u + 255u + 2u);
}

TEST_F(ChunkEncoderTest, EncodeChunk_ExtensionsInOrder) {
    chunk_encoder encoder({
        std::make_shared<constant_extension>(chunk_annotation{"a", "1"}),
        std::make_shared<constant_extension>(std::nullopt),
        std::make_shared<constant_extension>(chunk_annotation{"b", "2"}),
    });

    EXPECT_EQ(encoder.encode_chunk(as_bytes("xy")).to_string(), "2;a=1;b=2\r\nxy\r\n");
    EXPECT_EQ(encoder.encode_final_chunk().to_string(), "0;a=1;b=2\r\n\r\n");
}

TEST_F(ChunkEncoderTest, EncodeChunk_RunningCrc) {
    chunk_encoder encoder({std::make_shared<crc32_chunk_extension>()});

    EXPECT_EQ(encoder.encode_chunk(as_bytes("abc")).to_string(),
              "3;chunk-crc32=352441c2\r\nabc\r\n");
    // The checksum covers everything framed so far
    EXPECT_EQ(encoder.encode_chunk(as_bytes("def")).to_string(),
              "3;chunk-crc32=4b8e39ef\r\ndef\r\n");
    EXPECT_EQ(encoder.encode_final_chunk().to_string(), "0;chunk-crc32=4b8e39ef\r\n\r\n");
}

TEST_F(ChunkEncoderTest, Reset_RestartsExtensions) {
    auto crc = std::make_shared<crc32_chunk_extension>();
    chunk_encoder encoder({crc});

    auto first = encoder.encode_chunk(as_bytes("abc")).to_string();
    encoder.reset();
    auto again = encoder.encode_chunk(as_bytes("abc")).to_string();

    EXPECT_EQ(first, again);
}

// =============================================================================
// Framed Length
// =============================================================================

TEST_F(ChunkEncoderTest, FramedLength_MatchesEncodedOutput) {
    const std::string body = "abcdefghij";

    for (uint64_t chunk : {1u, 3u, 4u, 10u, 16u}) {
        SCOPED_TRACE("chunk=" + std::to_string(chunk));
        chunk_encoder encoder({std::make_shared<crc32_chunk_extension>()});

        std::string framed;
        for (std::size_t offset = 0; offset < body.size(); offset += chunk) {
            framed += encoder.encode_chunk(as_bytes(std::string_view(body).substr(offset, chunk)))
                          .to_string();
        }
        framed += encoder.encode_final_chunk().to_string();

        // ";chunk-crc32=" plus eight hex digits
        EXPECT_EQ(chunk_encoder::framed_length(body.size(), chunk, 13 + 8), framed.size());
    }
}

TEST_F(ChunkEncoderTest, FramedLength_EmptyPayloadIsFinalChunkOnly) {
    EXPECT_EQ(chunk_encoder::framed_length(0, 4, 0), 5u);
    EXPECT_EQ(chunk_encoder::framed_length(0, 4, 10), 15u);
}

TEST_F(ChunkEncoderTest, FramedLength_SignedStreamingUpload) {
    // 64 KiB chunk, 1 KiB chunk, final chunk, each with a chunk signature
    EXPECT_EQ(chunk_encoder::framed_length(66560, 65536,
                                           aws_v4::chunk_signature_extension_length),
              66824u);
}

}  // namespace kcenon::request_pipeline::test
