/**
 * @file exceptions.h
 * @brief 通用异常类型，覆盖编解码、上游通道与配置错误
 * @author cRelay Team
 * @date 2026-10-12
 */

#pragma once

#include <stdexcept>
#include <string>

namespace crelay {

/**
 * @brief 通用错误类型枚举
 */
enum class CommonError {
    INVALID_ARGUMENT,      // 无效参数
    RESOURCE_NOT_FOUND,    // 资源未找到
    OPERATION_FAILED,      // 操作失败
    TIMEOUT                // 超时
};

/**
 * @brief 通用异常基类
 */
class BaseException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     */
    explicit BaseException(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * @brief 构造函数
     * @param error 错误类型
     * @param message 错误消息
     */
    BaseException(CommonError error, const std::string& message)
        : std::runtime_error(message), error_(error) {}

    /**
     * @brief 获取错误类型
     * @return 错误类型
     */
    CommonError getError() const { return error_; }

private:
    CommonError error_{CommonError::OPERATION_FAILED};  // 默认错误类型
};

/**
 * @brief 请求编解码错误类型
 */
enum class CodecError {
    ENCODING_FAILED,   // 提示词无法序列化为上游请求格式
    DECODING_FAILED,   // 上游响应不符合预期格式（字段缺失、类型错误）
    EMPTY_RESULT       // 上游返回的候选列表为空
};

/**
 * @brief 编解码异常类
 */
class CodecException : public BaseException {
public:
    /**
     * @brief 构造函数
     * @param error 错误类型
     * @param message 错误消息
     */
    CodecException(CodecError error, const std::string& message)
        : BaseException(message), error_(error) {}

    /**
     * @brief 获取错误类型
     * @return 错误类型
     */
    CodecError getError() const { return error_; }

private:
    CodecError error_;  // 错误类型
};

/**
 * @brief 上游推理通道异常
 *
 * 传输失败、非2xx状态码、事件流中的exception帧或帧校验失败都归为此类。
 */
class ChannelException : public BaseException {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param httpStatus 上游HTTP状态码，未知时为0
     */
    explicit ChannelException(const std::string& message, long httpStatus = 0)
        : BaseException(message), httpStatus_(httpStatus) {}

    /**
     * @brief 获取上游HTTP状态码
     * @return 状态码，未收到响应时为0
     */
    long getHttpStatus() const { return httpStatus_; }

private:
    long httpStatus_;
};

/**
 * @brief 配置或密钥加载异常
 */
class ConfigException : public BaseException {
public:
    explicit ConfigException(const std::string& message)
        : BaseException(CommonError::RESOURCE_NOT_FOUND, message) {}
};

/**
 * @brief 获取编解码错误类型名称
 * @param error 错误类型
 * @return 名称字符串
 */
inline const char* codecErrorName(CodecError error) {
    switch (error) {
        case CodecError::ENCODING_FAILED: return "EncodingError";
        case CodecError::DECODING_FAILED: return "DecodingError";
        case CodecError::EMPTY_RESULT:    return "EmptyResultError";
    }
    return "CodecError";
}

}  // namespace crelay
