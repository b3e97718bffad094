#pragma once

#include <string>
#include <functional>
#include "crelay/http/response.h"

namespace crelay {

class ResponseBuilder {
public:
    static HttpResponse text(const std::string& text, int statusCode = 200);
    
    static HttpResponse error(int statusCode, const std::string& message);
    static HttpResponse badRequest(const std::string& message = "Bad request");
    static HttpResponse notFound(const std::string& message = "Not found");
    static HttpResponse internalError(const std::string& message = "Internal server error");
    static HttpResponse badGateway(const std::string& message = "Bad gateway");
    
    /**
     * @brief 构建分块传输的纯文本流式响应
     * @param producer 数据块生产函数
     * @param onCancel 客户端断开时的回调
     * @param onInterrupt 服务器停止时的回调
     */
    static HttpResponse streamingText(ChunkProducer producer, std::function<void()> onCancel = nullptr,
                                      std::function<void()> onInterrupt = nullptr);
};

}
