/**
 * @file bedrock_client.h
 * @brief 基于libcurl的Bedrock Runtime推理客户端
 * @author cRelay Team
 * @date 2026-10-13
 */

#ifndef CRELAY_CLIENT_BEDROCK_CLIENT_H
#define CRELAY_CLIENT_BEDROCK_CLIENT_H

#include "crelay/client/inference_client.h"
#include "crelay/client/event_stream.h"
#include "crelay/common/secrets.h"

#include <curl/curl.h>
#include <atomic>
#include <string>

namespace crelay {

/**
 * @brief 客户端选项
 */
struct BedrockClientOptions {
    Credentials credentials;
    std::string region{"eu-west-1"};
    std::string signingService{"bedrock"};
    int connectTimeoutMs{5000};
    int requestTimeoutMs{120000};    // 覆盖整个传输过程，包括流式响应
};

/**
 * @brief Bedrock Runtime客户端
 *
 * 请求通过libcurl内置的AWS SigV4签名发送到：
 *   POST {endpoint}/model/{modelId}/invoke
 *   POST {endpoint}/model/{modelId}/invoke-with-response-stream
 * 构造后选项不再修改，每次调用创建独立的curl句柄，可被多线程并发使用。
 */
class BedrockClient final : public IInferenceClient {
public:
    explicit BedrockClient(BedrockClientOptions options);
    ~BedrockClient() override = default;

    std::string invokeOnce(const std::string& modelId, const std::string& payload) const override;

    std::unique_ptr<IChunkSource> invokeStreaming(const std::string& modelId,
                                                  const std::string& payload) const override;

    /**
     * @brief 构造调用URL
     * @param modelId 模型ID，作为路径段做百分号编码
     * @param streaming 是否为流式调用
     * @return 完整URL
     */
    std::string buildInvokeUrl(const std::string& modelId, bool streaming) const;

    const BedrockClientOptions& options() const { return options_; }

private:
    CURL* createHandle(const std::string& url, const std::string& payload,
                       const char* accept, curl_slist** headers) const;

    BedrockClientOptions options_;
    std::string sigv4_;     ///< "aws:amz:{region}:{service}"
    std::string userPwd_;   ///< "{accessKeyId}:{secretAccessKey}"
};

/**
 * @brief Bedrock流式响应的chunk源
 *
 * 使用curl multi接口按需推进传输：只有在pull()时才读取socket，
 * 并且解码器中已有完整消息时不再读取新数据。析构时移除并释放curl句柄，
 * 连接随之关闭。
 */
class BedrockChunkSource final : public IChunkSource {
public:
    /**
     * @brief 构造函数，接管easy句柄和请求头链表
     */
    BedrockChunkSource(CURL* easy, curl_slist* headers);
    ~BedrockChunkSource() override;

    BedrockChunkSource(const BedrockChunkSource&) = delete;
    BedrockChunkSource& operator=(const BedrockChunkSource&) = delete;

    /**
     * @brief 推进传输直到拿到响应状态码
     * @throws ChannelException 传输失败或上游返回非200状态
     */
    void open();

    PullResult pull(Chunk& chunk) override;

    std::string lastError() const override { return lastError_; }

    /**
     * @brief 通过curl_multi_wakeup唤醒等待中的pull()
     */
    void interrupt() override;

    /**
     * @brief 将事件流消息转换为chunk
     * @param message 事件流消息
     * @param chunk 输出chunk
     * @param error 返回FAILED时的原因
     * @return CHUNK或FAILED
     */
    static PullResult translate(const EventStreamMessage& message, Chunk& chunk, std::string& error);

private:
    static size_t onWrite(char* ptr, size_t size, size_t nmemb, void* userdata);

    void pump();
    void updateStatus();
    PullResult fail(const std::string& message);

    CURLM* multi_;
    CURL* easy_;
    curl_slist* headers_;
    EventStreamDecoder decoder_;
    std::string errorBody_;
    long httpStatus_;
    bool transferDone_;
    CURLcode transferResult_;
    bool failed_;
    std::atomic<bool> interrupted_;
    std::string lastError_;
};

}  // namespace crelay

#endif
