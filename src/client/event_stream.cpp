#include "crelay/client/event_stream.h"
#include "crelay/common/exceptions.h"
#include <zlib.h>

namespace crelay {

namespace {

uint32_t readUint32(const char* data) {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

uint16_t readUint16(const char* data) {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

int64_t readInt64(const char* data) {
    uint64_t value = (static_cast<uint64_t>(readUint32(data)) << 32) | readUint32(data + 4);
    return static_cast<int64_t>(value);
}

uint32_t checksum(const char* data, size_t length) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(length));
    return static_cast<uint32_t>(crc);
}

} // namespace

std::string EventStreamMessage::headerString(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.type != EventStreamHeaderType::STRING) {
        return "";
    }
    return it->second.bytesValue;
}

EventStreamDecoder::EventStreamDecoder() : offset_(0) {
}

void EventStreamDecoder::feed(const char* data, size_t size) {
    if (size == 0) {
        return;
    }
    compact();
    buffer_.append(data, size);
}

size_t EventStreamDecoder::bufferedBytes() const {
    return buffer_.size() - offset_;
}

void EventStreamDecoder::compact() {
    // 已消费部分超过一半时再移动，避免每条消息都搬移缓冲区
    if (offset_ > 0 && offset_ * 2 >= buffer_.size()) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
}

bool EventStreamDecoder::next(EventStreamMessage& message) {
    if (bufferedBytes() < PRELUDE_LENGTH) {
        return false;
    }
    
    const char* start = buffer_.data() + offset_;
    const uint32_t totalLength = readUint32(start);
    const uint32_t headersLength = readUint32(start + 4);
    const uint32_t preludeCrc = readUint32(start + 8);
    
    if (checksum(start, 8) != preludeCrc) {
        throw ChannelException("event stream prelude checksum mismatch");
    }
    if (totalLength < MIN_MESSAGE_LENGTH || totalLength > MAX_MESSAGE_LENGTH) {
        throw ChannelException("event stream message length out of range: " + std::to_string(totalLength));
    }
    if (headersLength > MAX_HEADERS_LENGTH || headersLength > totalLength - MIN_MESSAGE_LENGTH) {
        throw ChannelException("event stream headers length out of range: " + std::to_string(headersLength));
    }
    
    if (bufferedBytes() < totalLength) {
        return false;
    }
    
    const uint32_t messageCrc = readUint32(start + totalLength - 4);
    if (checksum(start, totalLength - 4) != messageCrc) {
        throw ChannelException("event stream message checksum mismatch");
    }
    
    message.headers.clear();
    parseHeaders(start + PRELUDE_LENGTH, headersLength, message.headers);
    
    const size_t payloadLength = totalLength - headersLength - MIN_MESSAGE_LENGTH;
    message.payload.assign(start + PRELUDE_LENGTH + headersLength, payloadLength);
    
    offset_ += totalLength;
    return true;
}

void EventStreamDecoder::parseHeaders(const char* data, size_t length,
                                      std::map<std::string, EventStreamHeaderValue>& headers) {
    size_t pos = 0;
    auto need = [&](size_t bytes) {
        if (pos + bytes > length) {
            throw ChannelException("event stream header truncated");
        }
    };
    
    while (pos < length) {
        need(1);
        const size_t nameLength = static_cast<unsigned char>(data[pos]);
        pos += 1;
        need(nameLength + 1);
        std::string name(data + pos, nameLength);
        pos += nameLength;
        
        const uint8_t rawType = static_cast<uint8_t>(data[pos]);
        pos += 1;
        
        EventStreamHeaderValue value;
        value.type = static_cast<EventStreamHeaderType>(rawType);
        switch (value.type) {
            case EventStreamHeaderType::BOOL_TRUE:
                value.intValue = 1;
                break;
            case EventStreamHeaderType::BOOL_FALSE:
                value.intValue = 0;
                break;
            case EventStreamHeaderType::BYTE:
                need(1);
                value.intValue = static_cast<int8_t>(data[pos]);
                pos += 1;
                break;
            case EventStreamHeaderType::SHORT:
                need(2);
                value.intValue = static_cast<int16_t>(readUint16(data + pos));
                pos += 2;
                break;
            case EventStreamHeaderType::INTEGER:
                need(4);
                value.intValue = static_cast<int32_t>(readUint32(data + pos));
                pos += 4;
                break;
            case EventStreamHeaderType::LONG:
            case EventStreamHeaderType::TIMESTAMP:
                need(8);
                value.intValue = readInt64(data + pos);
                pos += 8;
                break;
            case EventStreamHeaderType::BYTE_ARRAY:
            case EventStreamHeaderType::STRING: {
                need(2);
                const size_t valueLength = readUint16(data + pos);
                pos += 2;
                need(valueLength);
                value.bytesValue.assign(data + pos, valueLength);
                pos += valueLength;
                break;
            }
            case EventStreamHeaderType::UUID:
                need(16);
                value.bytesValue.assign(data + pos, 16);
                pos += 16;
                break;
            default:
                throw ChannelException("unknown event stream header type " + std::to_string(rawType));
        }
        headers[name] = std::move(value);
    }
}

}  // namespace crelay
