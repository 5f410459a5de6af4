/**
 * @file test_chunked_encoded_publisher.cpp
 * @brief Unit tests for chunked_encoded_publisher
 */

#include <gtest/gtest.h>

#include <kcenon/request_pipeline/chunked/chunked_encoded_publisher.h>
#include <kcenon/request_pipeline/chunked/crc32_chunk_extension.h>
#include <kcenon/request_pipeline/stream/collecting_subscriber.h>
#include <kcenon/request_pipeline/stream/in_memory_byte_publisher.h>

#include "../stream/stream_test_support.h"

namespace kcenon::request_pipeline::test {

class ChunkedEncodedPublisherTest : public ::testing::Test {
protected:
    auto collect(const std::shared_ptr<byte_publisher>& publisher) -> std::string {
        auto collector = std::make_shared<collecting_subscriber>();
        publisher->subscribe(collector);
        EXPECT_TRUE(collector->done()->wait().has_value());
        return collector->to_string();
    }
};

TEST_F(ChunkedEncodedPublisherTest, Build_RejectsZeroChunkSize) {
    auto result = chunked_encoded_publisher::builder()
                      .with_source(in_memory_byte_publisher::from_string("x"))
                      .with_chunk_size(0)
                      .build();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_chunk_size);
}

TEST_F(ChunkedEncodedPublisherTest, Build_RequiresSource) {
    auto result = chunked_encoded_publisher::builder().build();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(ChunkedEncodedPublisherTest, RegroupsSourceBuffersIntoFixedChunks) {
    auto publisher = chunked_encoded_publisher::builder()
                         .with_source(in_memory_byte_publisher::from_string("hello world", 3))
                         .with_chunk_size(4)
                         .with_extension_length(0)
                         .build()
                         .value();

    auto framed = collect(publisher);

    EXPECT_EQ(framed, "4\r\nhell\r\n4\r\no wo\r\n3\r\nrld\r\n0\r\n\r\n");
    EXPECT_EQ(publisher->content_length(), framed.size());
}

TEST_F(ChunkedEncodedPublisherTest, EmptySourceEmitsOnlyFinalChunk) {
    auto publisher = chunked_encoded_publisher::builder()
                         .with_source(in_memory_byte_publisher::from_string(""))
                         .build()
                         .value();

    EXPECT_EQ(collect(publisher), "0\r\n\r\n");
}

TEST_F(ChunkedEncodedPublisherTest, ContentLengthNeedsBothLengths) {
    auto no_extension_length = chunked_encoded_publisher::builder()
                                   .with_source(in_memory_byte_publisher::from_string("abc"))
                                   .build()
                                   .value();
    auto unknown_source = chunked_encoded_publisher::builder()
                              .with_source(in_memory_byte_publisher::from_string("abc", 0, false))
                              .with_extension_length(0)
                              .build()
                              .value();

    EXPECT_FALSE(no_extension_length->content_length().has_value());
    EXPECT_FALSE(unknown_source->content_length().has_value());
}

TEST_F(ChunkedEncodedPublisherTest, ResubscribeRestartsExtensions) {
    auto publisher = chunked_encoded_publisher::builder()
                         .with_source(in_memory_byte_publisher::from_string("abcdef", 2))
                         .with_chunk_size(3)
                         .add_extension(std::make_shared<crc32_chunk_extension>())
                         .with_extension_length(21)
                         .build()
                         .value();

    auto first = collect(publisher);
    auto second = collect(publisher);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first,
              "3;chunk-crc32=352441c2\r\nabc\r\n"
              "3;chunk-crc32=4b8e39ef\r\ndef\r\n"
              "0;chunk-crc32=4b8e39ef\r\n\r\n");
    EXPECT_EQ(publisher->content_length(), first.size());
}

TEST_F(ChunkedEncodedPublisherTest, SourceErrorReachesSubscriber) {
    auto source = in_memory_byte_publisher::from_string("abcdef");
    source->set_failure(error{error_code::upstream_failed, "read failed"});
    auto publisher = chunked_encoded_publisher::builder()
                         .with_source(source)
                         .with_chunk_size(4)
                         .build()
                         .value();
    auto collector = std::make_shared<collecting_subscriber>();

    publisher->subscribe(collector);

    auto outcome = collector->done()->wait();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::upstream_failed);
    EXPECT_EQ(collector->to_string(), "4\r\nabcd\r\n");
}

TEST_F(ChunkedEncodedPublisherTest, ReadsOneSourceBufferPerDeliveredFrame) {
    auto source = scripted_source::create({"abcd", "efgh", "ij"});
    auto publisher = chunked_encoded_publisher::builder()
                         .with_source(source)
                         .with_chunk_size(4)
                         .build()
                         .value();
    auto reader = std::make_shared<manual_reader>();

    publisher->subscribe(reader);
    EXPECT_EQ(source->delivered(), 1u);
    EXPECT_TRUE(reader->text().empty());

    reader->pull(1);
    EXPECT_EQ(reader->text(), "4\r\nabcd\r\n");
    EXPECT_EQ(source->delivered(), 2u);
    EXPECT_EQ(source->max_outstanding(), 1u);

    reader->cancel();
    EXPECT_TRUE(source->cancelled());
}

}  // namespace kcenon::request_pipeline::test
