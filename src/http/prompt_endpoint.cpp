#include "crelay/http/prompt_endpoint.h"
#include "crelay/http/json_request_parser.h"
#include "crelay/http/response_builder.h"
#include "crelay/codec/titan_codec.h"
#include "crelay/streaming/streaming_adapter.h"
#include "crelay/common/exceptions.h"
#include "crelay/common/logger.h"
#include "crelay/common/utils.h"

namespace crelay {

PromptEndpoint::PromptEndpoint(std::shared_ptr<const IInferenceClient> client, const std::string& modelId)
    : ApiEndpoint("prompt", PATH, "POST"),
      client_(std::move(client)),
      modelId_(modelId) {
}

PromptEndpoint::~PromptEndpoint() {
}

bool PromptEndpoint::parsePrompt(const HttpRequest& request, std::string& prompt, std::string& error) {
    nlohmann::json body;
    if (!JsonRequestParser::validateJson(request.getBody(), body)) {
        error = JsonRequestParser::getLastError();
        return false;
    }
    if (!JsonRequestParser::getField<std::string>(body, "prompt", prompt, true)) {
        error = JsonRequestParser::getLastError();
        return false;
    }
    return true;
}

HttpResponse PromptEndpoint::handle(const HttpRequest& request) {
    std::string prompt;
    std::string error;
    if (!parsePrompt(request, prompt, error)) {
        CRELAY_WARN("[prompt] rejected request: %s", error.c_str());
        return ResponseBuilder::badRequest(error);
    }
    
    CRELAY_DEBUG("[prompt] prompt: %s", truncateForLog(prompt).c_str());
    
    std::string payload;
    try {
        payload = TitanCodec::encode(prompt);
    } catch (const CodecException& e) {
        CRELAY_WARN("[prompt] %s: %s", codecErrorName(e.getError()), e.what());
        return ResponseBuilder::badRequest(e.what());
    }
    
    std::string responseBody;
    try {
        responseBody = client_->invokeOnce(modelId_, payload);
    } catch (const ChannelException& e) {
        CRELAY_ERROR("[prompt] upstream call failed: %s", e.what());
        return ResponseBuilder::badGateway(e.what());
    }
    
    try {
        GenerationResult result = TitanCodec::decode(responseBody);
        std::string text = TitanCodec::firstText(result);
        CRELAY_DEBUG("[prompt] %d input tokens, %zu chars returned", result.inputTextTokenCount, text.size());
        return ResponseBuilder::text(text);
    } catch (const CodecException& e) {
        CRELAY_ERROR("[prompt] %s: %s", codecErrorName(e.getError()), e.what());
        return ResponseBuilder::internalError(std::string(codecErrorName(e.getError())) + ": " + e.what());
    }
}

StreamedPromptEndpoint::StreamedPromptEndpoint(std::shared_ptr<const IInferenceClient> client,
                                               const std::string& modelId,
                                               bool skipControlFrames)
    : ApiEndpoint("prompt_streamed", PATH, "POST"),
      client_(std::move(client)),
      modelId_(modelId),
      skipControlFrames_(skipControlFrames) {
}

StreamedPromptEndpoint::~StreamedPromptEndpoint() {
}

HttpResponse StreamedPromptEndpoint::handle(const HttpRequest& request) {
    std::string prompt;
    std::string error;
    if (!PromptEndpoint::parsePrompt(request, prompt, error)) {
        CRELAY_WARN("[prompt/streamed] rejected request: %s", error.c_str());
        return ResponseBuilder::badRequest(error);
    }
    
    std::string payload;
    try {
        payload = TitanCodec::encode(prompt);
    } catch (const CodecException& e) {
        CRELAY_WARN("[prompt/streamed] %s: %s", codecErrorName(e.getError()), e.what());
        return ResponseBuilder::badRequest(e.what());
    }
    
    std::unique_ptr<IChunkSource> source;
    try {
        source = client_->invokeStreaming(modelId_, payload);
    } catch (const ChannelException& e) {
        CRELAY_ERROR("[prompt/streamed] failed to open stream: %s", e.what());
        return ResponseBuilder::badGateway(e.what());
    }
    
    // 生产函数和两个回调共享同一个适配器
    auto adapter = std::make_shared<StreamingAdapter>(std::move(source), skipControlFrames_);
    
    return ResponseBuilder::streamingText(
        [adapter](std::string& chunk) {
            return adapter->next(chunk);
        },
        [adapter]() {
            adapter->cancel();
        },
        [adapter]() {
            adapter->interrupt();
        });
}

}
