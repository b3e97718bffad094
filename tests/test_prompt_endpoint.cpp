/**
 * @file test_prompt_endpoint.cpp
 * @brief /prompt 和 /prompt/streamed 端点测试（不需要启动服务器）
 * @author cRelay Team
 * @date 2026-10-17
 */

#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>

#include "crelay/http/prompt_endpoint.h"
#include "crelay/http/request.h"
#include "crelay/http/response.h"
#include "utils/http_test_helpers.h"
#include "utils/mock_chunk_source.h"
#include "utils/mock_inference_client.h"

namespace crelay {
namespace test {

namespace {

const char* MODEL_ID = "amazon.titan-text-lite-v1:0:4k";

HttpRequest makeRequest(const std::string& path, const std::string& body) {
    HttpRequest request = HttpTestHelpers::createPromptRequest(path, "");
    request.setBody(body);
    return request;
}

int errorCode(const HttpResponse& response) {
    return HttpTestHelpers::errorCode(response);
}

} // namespace

class PromptEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<MockInferenceClient>();
        endpoint_ = std::make_unique<PromptEndpoint>(client_, MODEL_ID);
    }
    
    std::shared_ptr<MockInferenceClient> client_;
    std::unique_ptr<PromptEndpoint> endpoint_;
};

TEST_F(PromptEndpointTest, ReturnsFirstCandidateText) {
    client_->onceResponse = titanChunk("Bonjour");
    
    HttpResponse response = endpoint_->handle(makeRequest("/prompt", R"({"prompt": "Say hello in French"})"));
    
    EXPECT_EQ(response.getStatusCode(), 200);
    EXPECT_EQ(response.getBody(), "Bonjour");
    EXPECT_EQ(response.getContentType(), "text/plain; charset=utf-8");
    EXPECT_FALSE(response.isStreaming());
    
    EXPECT_EQ(client_->onceCalls, 1);
    EXPECT_EQ(client_->lastModelId, MODEL_ID);
    nlohmann::json payload = nlohmann::json::parse(client_->lastPayload);
    EXPECT_EQ(payload["inputText"], "Say hello in French");
    EXPECT_EQ(payload["textGenerationConfig"]["maxTokenCount"], 100);
}

TEST_F(PromptEndpointTest, InvalidBodiesAreRejected) {
    const char* bodies[] = {
        "",
        "not json",
        "[\"prompt\"]",
        "{}",
        R"({"prompt": 42})",
        R"({"prompt": null})",
    };
    
    for (const char* body : bodies) {
        HttpResponse response = endpoint_->handle(makeRequest("/prompt", body));
        EXPECT_EQ(response.getStatusCode(), 400) << body;
        EXPECT_EQ(errorCode(response), 400) << body;
    }
    EXPECT_EQ(client_->onceCalls, 0);
}

TEST_F(PromptEndpointTest, InvalidUtf8PromptIsBadRequest) {
    HttpResponse response = endpoint_->handle(makeRequest("/prompt", std::string("{\"prompt\": \"\xff\xfe\"}")));
    EXPECT_EQ(response.getStatusCode(), 400);
    
    response = endpoint_->handle(makeRequest("/prompt", "{\"prompt\": \"\\ud800\"}"));
    EXPECT_EQ(response.getStatusCode(), 400);
    EXPECT_EQ(client_->onceCalls, 0);
}

TEST_F(PromptEndpointTest, UpstreamFailureIsBadGateway) {
    client_->onceError = "invoke returned HTTP 503: service unavailable";
    
    HttpResponse response = endpoint_->handle(makeRequest("/prompt", R"({"prompt": "hi"})"));
    EXPECT_EQ(response.getStatusCode(), 502);
    EXPECT_EQ(errorCode(response), 502);
}

TEST_F(PromptEndpointTest, UndecodableResponseIsInternalError) {
    client_->onceResponse = R"({"unexpected": true})";
    
    HttpResponse response = endpoint_->handle(makeRequest("/prompt", R"({"prompt": "hi"})"));
    EXPECT_EQ(response.getStatusCode(), 500);
    EXPECT_NE(response.getBody().find("DecodingError"), std::string::npos);
}

TEST_F(PromptEndpointTest, EmptyResultsIsInternalError) {
    client_->onceResponse = R"({"inputTextTokenCount": 1, "results": []})";
    
    HttpResponse response = endpoint_->handle(makeRequest("/prompt", R"({"prompt": "hi"})"));
    EXPECT_EQ(response.getStatusCode(), 500);
    EXPECT_NE(response.getBody().find("EmptyResultError"), std::string::npos);
}

class StreamedPromptEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<MockInferenceClient>();
        tracker_ = std::make_shared<MockChunkSource::Tracker>();
    }
    
    std::unique_ptr<StreamedPromptEndpoint> makeEndpoint(bool skipControlFrames = false) {
        return std::make_unique<StreamedPromptEndpoint>(client_, MODEL_ID, skipControlFrames);
    }
    
    std::shared_ptr<MockInferenceClient> client_;
    std::shared_ptr<MockChunkSource::Tracker> tracker_;
};

TEST_F(StreamedPromptEndpointTest, StreamsFragmentsInOrder) {
    auto tracker = tracker_;
    client_->streamFactory = [tracker]() {
        auto source = std::make_unique<MockChunkSource>(tracker);
        source->data(titanChunk("The ")).data(titanChunk("quick ")).data(titanChunk("fox"));
        return std::unique_ptr<IChunkSource>(std::move(source));
    };
    auto endpoint = makeEndpoint();
    
    HttpResponse response = endpoint->handle(makeRequest("/prompt/streamed", R"({"prompt": "story"})"));
    ASSERT_EQ(response.getStatusCode(), 200);
    ASSERT_TRUE(response.isStreaming());
    EXPECT_EQ(response.getContentType(), "text/plain; charset=utf-8");
    
    // 返回响应时尚未读取任何chunk
    EXPECT_EQ(tracker_->pulls.load(), 0);
    
    std::string body;
    std::string chunk;
    int chunks = 0;
    while (response.nextChunk(chunk)) {
        body += chunk;
        ++chunks;
    }
    EXPECT_EQ(chunks, 3);
    EXPECT_EQ(body, "The quick fox");
    EXPECT_TRUE(tracker_->destroyed.load());
}

TEST_F(StreamedPromptEndpointTest, EachChunkIsPulledOnDemand) {
    auto tracker = tracker_;
    client_->streamFactory = [tracker]() {
        auto source = std::make_unique<MockChunkSource>(tracker);
        source->data(titanChunk("a")).data(titanChunk("b")).data(titanChunk("c"));
        return std::unique_ptr<IChunkSource>(std::move(source));
    };
    auto endpoint = makeEndpoint();
    HttpResponse response = endpoint->handle(makeRequest("/prompt/streamed", R"({"prompt": "x"})"));
    
    std::string chunk;
    ASSERT_TRUE(response.nextChunk(chunk));
    EXPECT_EQ(tracker_->pulls.load(), 1);
    ASSERT_TRUE(response.nextChunk(chunk));
    EXPECT_EQ(tracker_->pulls.load(), 2);
}

TEST_F(StreamedPromptEndpointTest, CancelReleasesUpstream) {
    auto tracker = tracker_;
    client_->streamFactory = [tracker]() {
        auto source = std::make_unique<MockChunkSource>(tracker);
        source->data(titanChunk("a")).data(titanChunk("b"));
        return std::unique_ptr<IChunkSource>(std::move(source));
    };
    auto endpoint = makeEndpoint();
    HttpResponse response = endpoint->handle(makeRequest("/prompt/streamed", R"({"prompt": "x"})"));
    
    std::string chunk;
    ASSERT_TRUE(response.nextChunk(chunk));
    response.cancelStream();
    
    EXPECT_TRUE(tracker_->destroyed.load());
    EXPECT_FALSE(response.nextChunk(chunk));
    EXPECT_EQ(tracker_->pulls.load(), 1);
}

TEST_F(StreamedPromptEndpointTest, MidStreamFailureEndsBodySilently) {
    auto tracker = tracker_;
    client_->streamFactory = [tracker]() {
        auto source = std::make_unique<MockChunkSource>(tracker);
        source->data(titanChunk("partial")).failure("throttlingException: slow down");
        return std::unique_ptr<IChunkSource>(std::move(source));
    };
    auto endpoint = makeEndpoint();
    HttpResponse response = endpoint->handle(makeRequest("/prompt/streamed", R"({"prompt": "x"})"));
    EXPECT_EQ(response.getStatusCode(), 200);
    
    std::string body;
    std::string chunk;
    while (response.nextChunk(chunk)) {
        body += chunk;
    }
    EXPECT_EQ(body, "partial");
}

TEST_F(StreamedPromptEndpointTest, SkipsControlFramesWhenConfigured) {
    auto tracker = tracker_;
    client_->streamFactory = [tracker]() {
        auto source = std::make_unique<MockChunkSource>(tracker);
        source->data(titanChunk("a")).control("metadata").data(titanChunk("b"));
        return std::unique_ptr<IChunkSource>(std::move(source));
    };
    auto endpoint = makeEndpoint(true);
    HttpResponse response = endpoint->handle(makeRequest("/prompt/streamed", R"({"prompt": "x"})"));
    
    std::string body;
    std::string chunk;
    while (response.nextChunk(chunk)) {
        body += chunk;
    }
    EXPECT_EQ(body, "ab");
}

TEST_F(StreamedPromptEndpointTest, OpenFailureIsBadGateway) {
    client_->streamError = "invoke-with-response-stream returned HTTP 403: denied";
    auto endpoint = makeEndpoint();
    
    HttpResponse response = endpoint->handle(makeRequest("/prompt/streamed", R"({"prompt": "x"})"));
    EXPECT_EQ(response.getStatusCode(), 502);
    EXPECT_FALSE(response.isStreaming());
}

TEST_F(StreamedPromptEndpointTest, InvalidBodyIsBadRequest) {
    auto endpoint = makeEndpoint();
    
    HttpResponse response = endpoint->handle(makeRequest("/prompt/streamed", R"({"text": "x"})"));
    EXPECT_EQ(response.getStatusCode(), 400);
    EXPECT_EQ(client_->streamCalls, 0);
}

} // namespace test
} // namespace crelay
