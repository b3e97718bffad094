/**
 * @file chunk_source.h
 * @brief 上游流式响应的拉取接口
 * @author cRelay Team
 * @date 2026-10-13
 */

#ifndef CRELAY_CLIENT_CHUNK_SOURCE_H
#define CRELAY_CLIENT_CHUNK_SOURCE_H

#include <string>

namespace crelay {

/**
 * @brief 流式协议中的一个单元
 */
struct Chunk {
    enum class Kind {
        DATA,     ///< 携带数据，bytes可解码为部分生成结果
        CONTROL   ///< 非数据事件（元数据、控制帧）
    };

    Kind kind = Kind::DATA;
    std::string bytes;       ///< DATA时为原始字节
    std::string eventType;   ///< 上游事件类型名，用于日志
};

/**
 * @brief 单次拉取的结果
 */
enum class PullResult {
    CHUNK,           ///< 得到一个chunk
    END_OF_STREAM,   ///< 上游正常结束
    FAILED           ///< 通道失败，原因见lastError()
};

/**
 * @brief 已打开的流式通道句柄
 *
 * 由一次流式调用独占，不跨请求共享。析构即释放底层连接。
 */
class IChunkSource {
public:
    virtual ~IChunkSource() = default;

    /**
     * @brief 拉取下一个chunk，阻塞直到有chunk、流结束或失败
     * @param chunk 输出chunk，仅当返回CHUNK时有效
     * @return 拉取结果
     */
    virtual PullResult pull(Chunk& chunk) = 0;

    /**
     * @brief 最近一次失败的原因
     */
    virtual std::string lastError() const = 0;

    /**
     * @brief 唤醒阻塞中的pull()，使其尽快返回FAILED
     *
     * 可从其他线程调用。不阻塞的实现无需覆盖。
     */
    virtual void interrupt() {}
};

}  // namespace crelay

#endif
