/**
 * @file streaming_adapter.h
 * @brief 流式适配器，把上游chunk源转换为按需拉取的文本片段序列
 * @author cRelay Team
 * @date 2026-10-14
 */

#ifndef CRELAY_STREAMING_STREAMING_ADAPTER_H
#define CRELAY_STREAMING_STREAMING_ADAPTER_H

#include "crelay/client/chunk_source.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace crelay {

/**
 * @brief 适配器输出的一个元素
 */
struct StreamEvent {
    enum class Kind {
        TEXT,    ///< 文本片段
        ERROR,   ///< 因错误提前结束，之后不再有元素
        END      ///< 正常结束
    };

    Kind kind = Kind::END;
    std::string text;      ///< TEXT时为片段，ERROR时为错误描述
};

/**
 * @brief 流式适配器
 *
 * 状态机：OPEN --(结束/控制帧/解码失败/空结果/通道失败/取消)--> CLOSED。
 * CLOSED为终态，进入时立即释放chunk源，之后的拉取不会再访问上游。
 * 每个流式请求创建一个实例，不可重入、不可重启。
 */
class StreamingAdapter {
public:
    enum class State {
        OPEN,
        CLOSED
    };

    enum class CloseReason {
        NONE,             ///< 尚未关闭
        END_OF_STREAM,    ///< 上游正常结束
        CONTROL_FRAME,    ///< 收到非数据事件
        DECODE_FAILED,    ///< chunk数据不符合响应格式
        EMPTY_RESULT,     ///< chunk中没有候选结果
        CHANNEL_FAILED,   ///< 上游通道失败
        CANCELLED         ///< 调用方主动取消（客户端断开）
    };

    /**
     * @brief 构造函数
     * @param source 已打开的chunk源，由适配器独占
     * @param skipControlFrames 为true时跳过非数据事件而不是结束流
     */
    explicit StreamingAdapter(std::unique_ptr<IChunkSource> source, bool skipControlFrames = false);

    ~StreamingAdapter();

    StreamingAdapter(const StreamingAdapter&) = delete;
    StreamingAdapter& operator=(const StreamingAdapter&) = delete;

    /**
     * @brief 拉取下一个元素
     *
     * 出错时返回一次ERROR，之后与END一样，后续调用都返回END。
     */
    StreamEvent nextEvent();

    /**
     * @brief 拉取下一个文本片段
     * @param fragment 输出片段
     * @return 序列已结束（无论原因）时返回false
     */
    bool next(std::string& fragment);

    /**
     * @brief 停止拉取并释放chunk源
     */
    void cancel();
    
    /**
     * @brief 从其他线程唤醒阻塞中的拉取，之后的拉取都返回END
     *
     * 只标记并唤醒，chunk源仍由拉取线程释放。
     */
    void interrupt();

    State state() const { return state_; }
    CloseReason closeReason() const { return closeReason_; }
    size_t fragmentsEmitted() const { return fragmentsEmitted_; }

    static const char* closeReasonName(CloseReason reason);

private:
    void close(CloseReason reason);
    StreamEvent closeWithError(CloseReason reason, const std::string& message);

    std::unique_ptr<IChunkSource> source_;
    std::mutex sourceMutex_;         ///< 保护source_的释放与interrupt()
    std::atomic<bool> interrupted_;
    bool skipControlFrames_;
    State state_;
    CloseReason closeReason_;
    size_t fragmentsEmitted_;
};

}  // namespace crelay

#endif
