/**
 * @file test_event_stream.cpp
 * @brief 事件流解码与chunk转换测试
 * @author cRelay Team
 * @date 2026-10-16
 */

#include <gtest/gtest.h>

#include "crelay/client/bedrock_client.h"
#include "crelay/client/event_stream.h"
#include "crelay/common/exceptions.h"
#include "utils/event_stream_builder.h"

namespace crelay {
namespace test {

TEST(EventStreamDecoderTest, DecodesSingleMessage) {
    std::string frame = EventStreamBuilder()
        .header(":message-type", "event")
        .header(":event-type", "chunk")
        .payload("{\"bytes\":\"eA==\"}")
        .build();
    
    EventStreamDecoder decoder;
    decoder.feed(frame.data(), frame.size());
    
    EventStreamMessage message;
    ASSERT_TRUE(decoder.next(message));
    EXPECT_EQ(message.headerString(":message-type"), "event");
    EXPECT_EQ(message.headerString(":event-type"), "chunk");
    EXPECT_EQ(message.headerString(":missing"), "");
    EXPECT_EQ(message.payload, "{\"bytes\":\"eA==\"}");
    EXPECT_EQ(decoder.bufferedBytes(), 0u);
    EXPECT_FALSE(decoder.next(message));
}

TEST(EventStreamDecoderTest, ReassemblesAcrossFeedBoundaries) {
    std::string stream = EventStreamBuilder::chunkEvent("YQ==") +
                         EventStreamBuilder::chunkEvent("Yg==") +
                         EventStreamBuilder::chunkEvent("Yw==");
    
    // 每次只喂一个字节
    EventStreamDecoder decoder;
    std::vector<std::string> payloads;
    EventStreamMessage message;
    for (char c : stream) {
        decoder.feed(&c, 1);
        while (decoder.next(message)) {
            payloads.push_back(message.payload);
        }
    }
    
    ASSERT_EQ(payloads.size(), 3u);
    EXPECT_EQ(payloads[0], "{\"bytes\":\"YQ==\"}");
    EXPECT_EQ(payloads[2], "{\"bytes\":\"Yw==\"}");
    EXPECT_EQ(decoder.bufferedBytes(), 0u);
}

TEST(EventStreamDecoderTest, EmptyPayloadAndNoHeaders) {
    std::string frame = EventStreamBuilder().build();
    ASSERT_EQ(frame.size(), EventStreamDecoder::MIN_MESSAGE_LENGTH);
    
    EventStreamDecoder decoder;
    decoder.feed(frame.data(), frame.size());
    EventStreamMessage message;
    ASSERT_TRUE(decoder.next(message));
    EXPECT_TRUE(message.headers.empty());
    EXPECT_TRUE(message.payload.empty());
}

TEST(EventStreamDecoderTest, RejectsBadPreludeChecksum) {
    std::string frame = EventStreamBuilder::chunkEvent("YQ==");
    frame[9] = static_cast<char>(frame[9] ^ 0x01);
    
    EventStreamDecoder decoder;
    decoder.feed(frame.data(), frame.size());
    EventStreamMessage message;
    EXPECT_THROW(decoder.next(message), ChannelException);
}

TEST(EventStreamDecoderTest, RejectsBadMessageChecksum) {
    std::string frame = EventStreamBuilder::chunkEvent("YQ==");
    frame[frame.size() - 6] = static_cast<char>(frame[frame.size() - 6] ^ 0x20);
    
    EventStreamDecoder decoder;
    decoder.feed(frame.data(), frame.size());
    EventStreamMessage message;
    EXPECT_THROW(decoder.next(message), ChannelException);
}

TEST(EventStreamDecoderTest, WaitsForCompleteMessage) {
    std::string frame = EventStreamBuilder::chunkEvent("YQ==");
    
    EventStreamDecoder decoder;
    decoder.feed(frame.data(), frame.size() - 1);
    EventStreamMessage message;
    EXPECT_FALSE(decoder.next(message));
    EXPECT_EQ(decoder.bufferedBytes(), frame.size() - 1);
    
    decoder.feed(frame.data() + frame.size() - 1, 1);
    EXPECT_TRUE(decoder.next(message));
}

TEST(ChunkTranslateTest, ChunkEventBecomesDataChunk) {
    std::string frame = EventStreamBuilder::chunkEvent(EventStreamBuilder::base64("{\"k\":1}"));
    EventStreamDecoder decoder;
    decoder.feed(frame.data(), frame.size());
    EventStreamMessage message;
    ASSERT_TRUE(decoder.next(message));
    
    Chunk chunk;
    std::string error;
    EXPECT_EQ(BedrockChunkSource::translate(message, chunk, error), PullResult::CHUNK);
    EXPECT_EQ(chunk.kind, Chunk::Kind::DATA);
    EXPECT_EQ(chunk.bytes, "{\"k\":1}");
    EXPECT_EQ(chunk.eventType, "chunk");
}

TEST(ChunkTranslateTest, OtherEventBecomesControlChunk) {
    EventStreamMessage message;
    message.headers[":message-type"].bytesValue = "event";
    message.headers[":event-type"].bytesValue = "metadata";
    message.payload = "{}";
    
    Chunk chunk;
    std::string error;
    EXPECT_EQ(BedrockChunkSource::translate(message, chunk, error), PullResult::CHUNK);
    EXPECT_EQ(chunk.kind, Chunk::Kind::CONTROL);
    EXPECT_EQ(chunk.eventType, "metadata");
}

TEST(ChunkTranslateTest, ExceptionMessageFails) {
    std::string frame = EventStreamBuilder::exceptionEvent("throttlingException", "Too many requests");
    EventStreamDecoder decoder;
    decoder.feed(frame.data(), frame.size());
    EventStreamMessage message;
    ASSERT_TRUE(decoder.next(message));
    
    Chunk chunk;
    std::string error;
    EXPECT_EQ(BedrockChunkSource::translate(message, chunk, error), PullResult::FAILED);
    EXPECT_NE(error.find("throttlingException"), std::string::npos);
    EXPECT_NE(error.find("Too many requests"), std::string::npos);
}

TEST(ChunkTranslateTest, MissingBytesGivesEmptyData) {
    EventStreamMessage message;
    message.headers[":message-type"].bytesValue = "event";
    message.headers[":event-type"].bytesValue = "chunk";
    message.payload = "{\"other\":1}";
    
    Chunk chunk;
    std::string error;
    EXPECT_EQ(BedrockChunkSource::translate(message, chunk, error), PullResult::CHUNK);
    EXPECT_EQ(chunk.kind, Chunk::Kind::DATA);
    EXPECT_TRUE(chunk.bytes.empty());
}

TEST(ChunkTranslateTest, MalformedEnvelopeFails) {
    EventStreamMessage message;
    message.headers[":message-type"].bytesValue = "event";
    message.headers[":event-type"].bytesValue = "chunk";
    
    Chunk chunk;
    std::string error;
    message.payload = "not json";
    EXPECT_EQ(BedrockChunkSource::translate(message, chunk, error), PullResult::FAILED);
    
    message.payload = "{\"bytes\":\"@@@\"}";
    EXPECT_EQ(BedrockChunkSource::translate(message, chunk, error), PullResult::FAILED);
}

TEST(BedrockClientTest, BuildsInvokeUrls) {
    BedrockClientOptions options;
    options.credentials.accessKeyId = "AKID";
    options.credentials.secretAccessKey = "SECRET";
    options.credentials.endpointUrl = "https://bedrock-runtime.eu-west-1.amazonaws.com/";
    BedrockClient client(options);
    
    EXPECT_EQ(client.buildInvokeUrl("amazon.titan-text-lite-v1:0:4k", false),
              "https://bedrock-runtime.eu-west-1.amazonaws.com/model/amazon.titan-text-lite-v1%3A0%3A4k/invoke");
    EXPECT_EQ(client.buildInvokeUrl("amazon.titan-text-lite-v1:0:4k", true),
              "https://bedrock-runtime.eu-west-1.amazonaws.com/model/amazon.titan-text-lite-v1%3A0%3A4k/invoke-with-response-stream");
}

TEST(BedrockClientTest, UnreachableEndpointRaisesChannelError) {
    BedrockClientOptions options;
    options.credentials.accessKeyId = "AKID";
    options.credentials.secretAccessKey = "SECRET";
    options.credentials.endpointUrl = "http://127.0.0.1:1";
    options.connectTimeoutMs = 500;
    options.requestTimeoutMs = 1000;
    BedrockClient client(options);
    
    EXPECT_THROW(client.invokeOnce("model", "{}"), ChannelException);
    EXPECT_THROW(client.invokeStreaming("model", "{}"), ChannelException);
}

} // namespace test
} // namespace crelay
