#include "crelay/streaming/streaming_adapter.h"
#include "crelay/codec/titan_codec.h"
#include "crelay/common/exceptions.h"
#include "crelay/common/logger.h"

namespace crelay {

StreamingAdapter::StreamingAdapter(std::unique_ptr<IChunkSource> source, bool skipControlFrames)
    : source_(std::move(source)),
      interrupted_(false),
      skipControlFrames_(skipControlFrames),
      state_(State::OPEN),
      closeReason_(CloseReason::NONE),
      fragmentsEmitted_(0) {
    if (!source_) {
        close(CloseReason::CHANNEL_FAILED);
    }
}

StreamingAdapter::~StreamingAdapter() {
}

const char* StreamingAdapter::closeReasonName(CloseReason reason) {
    switch (reason) {
        case CloseReason::NONE:           return "none";
        case CloseReason::END_OF_STREAM:  return "end_of_stream";
        case CloseReason::CONTROL_FRAME:  return "control_frame";
        case CloseReason::DECODE_FAILED:  return "decode_failed";
        case CloseReason::EMPTY_RESULT:   return "empty_result";
        case CloseReason::CHANNEL_FAILED: return "channel_failed";
        case CloseReason::CANCELLED:      return "cancelled";
    }
    return "unknown";
}

void StreamingAdapter::close(CloseReason reason) {
    if (state_ == State::CLOSED) {
        return;
    }
    state_ = State::CLOSED;
    closeReason_ = reason;
    // 释放上游连接
    std::lock_guard<std::mutex> lock(sourceMutex_);
    source_.reset();
}

StreamEvent StreamingAdapter::closeWithError(CloseReason reason, const std::string& message) {
    CRELAY_WARN("[stream] terminated after %zu fragments (%s): %s",
                fragmentsEmitted_, closeReasonName(reason), message.c_str());
    close(reason);

    StreamEvent event;
    event.kind = StreamEvent::Kind::ERROR;
    event.text = message;
    return event;
}

StreamEvent StreamingAdapter::nextEvent() {
    StreamEvent event;
    if (state_ == State::CLOSED) {
        return event;
    }
    if (interrupted_.load()) {
        close(CloseReason::CANCELLED);
        return event;
    }

    Chunk chunk;
    while (true) {
        PullResult result = source_->pull(chunk);

        if (result == PullResult::END_OF_STREAM) {
            CRELAY_DEBUG("[stream] upstream finished after %zu fragments", fragmentsEmitted_);
            close(CloseReason::END_OF_STREAM);
            return event;
        }

        if (result == PullResult::FAILED) {
            if (interrupted_.load()) {
                CRELAY_INFO("[stream] interrupted after %zu fragments", fragmentsEmitted_);
                close(CloseReason::CANCELLED);
                return event;
            }
            return closeWithError(CloseReason::CHANNEL_FAILED, source_->lastError());
        }

        if (chunk.kind == Chunk::Kind::CONTROL) {
            if (skipControlFrames_) {
                CRELAY_DEBUG("[stream] skipping control event '%s'", chunk.eventType.c_str());
                continue;
            }
            CRELAY_DEBUG("[stream] control event '%s' ends the stream", chunk.eventType.c_str());
            close(CloseReason::CONTROL_FRAME);
            return event;
        }
        break;
    }

    GenerationResult decoded;
    try {
        decoded = TitanCodec::decode(chunk.bytes);
    } catch (const CodecException& e) {
        return closeWithError(CloseReason::DECODE_FAILED, e.what());
    }

    try {
        event.text = TitanCodec::firstText(decoded);
    } catch (const CodecException& e) {
        return closeWithError(CloseReason::EMPTY_RESULT, e.what());
    }

    event.kind = StreamEvent::Kind::TEXT;
    ++fragmentsEmitted_;
    return event;
}

bool StreamingAdapter::next(std::string& fragment) {
    StreamEvent event = nextEvent();
    if (event.kind != StreamEvent::Kind::TEXT) {
        return false;
    }
    fragment = std::move(event.text);
    return true;
}

void StreamingAdapter::cancel() {
    if (state_ == State::OPEN) {
        CRELAY_INFO("[stream] cancelled after %zu fragments", fragmentsEmitted_);
    }
    close(CloseReason::CANCELLED);
}

void StreamingAdapter::interrupt() {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    interrupted_.store(true);
    if (source_) {
        source_->interrupt();
    }
}

}  // namespace crelay
