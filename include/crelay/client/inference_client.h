/**
 * @file inference_client.h
 * @brief 上游推理服务客户端接口
 * @author cRelay Team
 * @date 2026-10-13
 */

#ifndef CRELAY_CLIENT_INFERENCE_CLIENT_H
#define CRELAY_CLIENT_INFERENCE_CLIENT_H

#include "crelay/client/chunk_source.h"

#include <memory>
#include <string>

namespace crelay {

/**
 * @brief 推理客户端接口
 *
 * 实现不得持有请求级可变状态，同一实例可被多个请求线程并发调用。
 */
class IInferenceClient {
public:
    virtual ~IInferenceClient() = default;

    /**
     * @brief 单次调用，返回完整响应体
     * @param modelId 模型ID
     * @param payload 请求体
     * @return 响应体
     * @throws ChannelException 传输失败或上游返回错误状态
     */
    virtual std::string invokeOnce(const std::string& modelId, const std::string& payload) const = 0;

    /**
     * @brief 流式调用，返回已打开的chunk源
     * @param modelId 模型ID
     * @param payload 请求体
     * @return chunk源，调用方独占
     * @throws ChannelException 无法建立流或上游在首个事件前返回错误
     */
    virtual std::unique_ptr<IChunkSource> invokeStreaming(const std::string& modelId,
                                                          const std::string& payload) const = 0;
};

}  // namespace crelay

#endif
