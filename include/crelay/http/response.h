/**
 * @file response.h
 * @brief HTTP响应类，支持普通响应与按需拉取的分块流式响应
 * @author cRelay Team
 * @date 2026-10-14
 */
#ifndef CRELAY_HTTP_RESPONSE_H
#define CRELAY_HTTP_RESPONSE_H

#include <string>
#include <map>
#include <functional>

namespace crelay {

/**
 * @brief 流式数据块生产函数
 * @param chunk 输出的数据块
 * @return 没有更多数据时返回false
 */
using ChunkProducer = std::function<bool(std::string& chunk)>;

/**
 * @brief HTTP响应类
 *
 * 流式响应不保存数据块，而是持有一个生产函数：服务器每写完一块才拉取下一块。
 */
class HttpResponse {
public:
    HttpResponse();
    ~HttpResponse();
    
    /**
     * @brief 设置HTTP响应状态码
     * @param code HTTP状态码（如200、404等）
     */
    void setStatusCode(int code);
    
    void setHeader(const std::string& name, const std::string& value);
    void setBody(const std::string& body);
    
    /**
     * @brief 设置HTTP响应的Content-Type头部
     * @param contentType MIME类型（如application/json、text/plain等）
     */
    void setContentType(const std::string& contentType);
    
    int getStatusCode() const;
    std::string getHeader(const std::string& name) const;
    const std::string& getBody() const;
    std::string getContentType() const;
    const std::map<std::string, std::string>& getAllHeaders() const;
    
    /**
     * @brief 设置错误响应，响应体为 {"error": {"code": ..., "message": ...}}
     * @param code 错误状态码
     * @param message 错误消息
     */
    void setError(int code, const std::string& message);
    
    /**
     * @brief 启用流式响应
     * @param producer 数据块生产函数
     * @param onCancel 客户端断开时调用，用于释放上游资源
     * @param onInterrupt 服务器停止时从其他线程调用，唤醒阻塞中的生产函数
     */
    void enableStreaming(ChunkProducer producer, std::function<void()> onCancel = nullptr,
                         std::function<void()> onInterrupt = nullptr);
    
    bool isStreaming() const;
    
    /**
     * @brief 拉取下一个数据块
     * @param chunk 输出的数据块
     * @return 流已结束时返回false
     */
    bool nextChunk(std::string& chunk);
    
    /**
     * @brief 放弃剩余数据块（客户端断开），并释放生产函数
     */
    void cancelStream();
    
    /**
     * @brief 唤醒阻塞在nextChunk()中的生产函数，可从其他线程调用
     */
    void interruptStream() const;
    
    /**
     * @brief 获取状态码对应的原因短语
     */
    static const char* reasonPhrase(int code);
    
private:
    int statusCode_;                 ///< HTTP状态码
    std::map<std::string, std::string> headers_;  ///< HTTP响应头部
    std::string body_;               ///< HTTP响应体
    bool streaming_;                 ///< 是否为流式响应
    ChunkProducer producer_;         ///< 流式数据块生产函数
    std::function<void()> onCancel_; ///< 流被放弃时的回调
    std::function<void()> onInterrupt_;  ///< 设置后不再修改
};

}

#endif
