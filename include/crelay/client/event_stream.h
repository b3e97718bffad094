/**
 * @file event_stream.h
 * @brief 二进制事件流（application/vnd.amazon.eventstream）分帧解码器
 * @author cRelay Team
 * @date 2026-10-13
 */

#ifndef CRELAY_CLIENT_EVENT_STREAM_H
#define CRELAY_CLIENT_EVENT_STREAM_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace crelay {

/**
 * @brief 事件流头部值类型
 */
enum class EventStreamHeaderType : uint8_t {
    BOOL_TRUE = 0,
    BOOL_FALSE = 1,
    BYTE = 2,
    SHORT = 3,
    INTEGER = 4,
    LONG = 5,
    BYTE_ARRAY = 6,
    STRING = 7,
    TIMESTAMP = 8,
    UUID = 9
};

/**
 * @brief 事件流头部值
 *
 * 整数与布尔类型存于intValue，字符串、字节数组与UUID的原始字节存于bytesValue。
 */
struct EventStreamHeaderValue {
    EventStreamHeaderType type = EventStreamHeaderType::STRING;
    int64_t intValue = 0;
    std::string bytesValue;
};

/**
 * @brief 一条完整的事件流消息
 */
struct EventStreamMessage {
    std::map<std::string, EventStreamHeaderValue> headers;
    std::string payload;

    /**
     * @brief 获取字符串类型头部
     * @param name 头部名称
     * @return 头部值，不存在或不是字符串时返回空字符串
     */
    std::string headerString(const std::string& name) const;
};

/**
 * @brief 增量式事件流解码器
 *
 * 消息格式：
 *   [total_length:4][headers_length:4][prelude_crc:4][headers][payload][message_crc:4]
 * 整数均为大端序，CRC为CRC32（IEEE）。字节可以在任意位置被拆分后分批feed。
 * 单个实例只服务一条流，不是线程安全的。
 */
class EventStreamDecoder {
public:
    static constexpr size_t PRELUDE_LENGTH = 12;
    static constexpr size_t MIN_MESSAGE_LENGTH = 16;
    static constexpr size_t MAX_MESSAGE_LENGTH = 16 * 1024 * 1024;
    static constexpr size_t MAX_HEADERS_LENGTH = 128 * 1024;

    EventStreamDecoder();

    /**
     * @brief 追加收到的字节
     */
    void feed(const char* data, size_t size);

    /**
     * @brief 取出下一条完整消息
     * @param message 输出消息
     * @return 缓冲区内没有完整消息时返回false
     * @throws ChannelException 长度非法或CRC校验失败
     */
    bool next(EventStreamMessage& message);

    /**
     * @brief 缓冲区中尚未消费的字节数
     */
    size_t bufferedBytes() const;

private:
    void compact();
    static void parseHeaders(const char* data, size_t length,
                             std::map<std::string, EventStreamHeaderValue>& headers);

    std::string buffer_;
    size_t offset_;
};

}  // namespace crelay

#endif
