/**
 * @file prompt_endpoint.h
 * @brief 提示词端点，把请求转发给上游推理服务
 * @author cRelay Team
 * @date 2026-10-15
 */
#ifndef CRELAY_PROMPT_ENDPOINT_H
#define CRELAY_PROMPT_ENDPOINT_H

#include "crelay/http/api_endpoint.h"
#include "crelay/client/inference_client.h"
#include <memory>
#include <string>

namespace crelay {

/**
 * @brief 非流式提示词端点 POST /prompt
 *
 * 请求体为 {"prompt": "..."}，成功时以text/plain返回第一个候选结果的文本。
 * 错误映射：请求无效或编码失败400，上游失败502，响应解码失败或无候选500。
 */
class PromptEndpoint : public ApiEndpoint {
public:
    static constexpr const char* PATH = "/prompt";
    
    PromptEndpoint(std::shared_ptr<const IInferenceClient> client, const std::string& modelId);
    ~PromptEndpoint() override;
    
    HttpResponse handle(const HttpRequest& request) override;
    
    /**
     * @brief 从请求体中取出prompt字段
     * @param request HTTP请求对象
     * @param prompt 输出提示词
     * @param error 失败原因
     * @return 请求体不是JSON对象或prompt不是字符串时返回false
     */
    static bool parsePrompt(const HttpRequest& request, std::string& prompt, std::string& error);
    
private:
    std::shared_ptr<const IInferenceClient> client_;
    std::string modelId_;
};

/**
 * @brief 流式提示词端点 POST /prompt/streamed
 *
 * 上游连接建立成功后返回200并以分块传输逐段发送文本，每段对应一个上游chunk。
 * 流开始之后的任何错误只会让响应体提前结束。
 */
class StreamedPromptEndpoint : public ApiEndpoint {
public:
    static constexpr const char* PATH = "/prompt/streamed";
    
    StreamedPromptEndpoint(std::shared_ptr<const IInferenceClient> client,
                           const std::string& modelId,
                           bool skipControlFrames);
    ~StreamedPromptEndpoint() override;
    
    HttpResponse handle(const HttpRequest& request) override;
    
private:
    std::shared_ptr<const IInferenceClient> client_;
    std::string modelId_;
    bool skipControlFrames_;
};

}

#endif
