#include <streambridge/core/frame/frame_decoder.hpp>
#include <streambridge/core/frame/crc32.hpp>
#include <spdlog/spdlog.h>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace StreamBridge {

namespace {

inline uint32_t readUint32BE(const uint8_t* data) {
    uint32_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohl(v);
}

inline uint16_t readUint16BE(const uint8_t* data) {
    uint16_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohs(v);
}

inline uint64_t readUint64BE(const uint8_t* data) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | data[i];
    }
    return v;
}

/**
 * Bounds-checked reader over the header block.
 */
class HeaderCursor {
public:
    HeaderCursor(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    bool atEnd() const { return pos_ >= len_; }

    const uint8_t* take(size_t n, const char* what) {
        if (len_ - pos_ < n) {
            throw FrameCorruption(std::string("header block truncated reading ") + what);
        }
        const uint8_t* p = data_ + pos_;
        pos_ += n;
        return p;
    }

    uint8_t u8(const char* what) { return *take(1, what); }
    uint16_t u16(const char* what) { return readUint16BE(take(2, what)); }
    uint32_t u32(const char* what) { return readUint32BE(take(4, what)); }
    uint64_t u64(const char* what) { return readUint64BE(take(8, what)); }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

HeaderValue readHeaderValue(HeaderCursor& cur, uint8_t tag) {
    switch (static_cast<HeaderType>(tag)) {
        case HeaderType::BOOL_TRUE:
            return HeaderValue::fromBool(true);
        case HeaderType::BOOL_FALSE:
            return HeaderValue::fromBool(false);
        case HeaderType::BYTE:
            return HeaderValue::fromByte(static_cast<int8_t>(cur.u8("byte value")));
        case HeaderType::SHORT:
            return HeaderValue::fromShort(static_cast<int16_t>(cur.u16("short value")));
        case HeaderType::INTEGER:
            return HeaderValue::fromInt32(static_cast<int32_t>(cur.u32("integer value")));
        case HeaderType::LONG:
            return HeaderValue::fromInt64(static_cast<int64_t>(cur.u64("long value")));
        case HeaderType::BYTE_ARRAY: {
            uint16_t n = cur.u16("byte array length");
            const uint8_t* p = cur.take(n, "byte array");
            return HeaderValue::fromBytes(ByteBuffer(p, p + n));
        }
        case HeaderType::STRING: {
            uint16_t n = cur.u16("string length");
            const uint8_t* p = cur.take(n, "string");
            return HeaderValue::fromString(std::string(reinterpret_cast<const char*>(p), n));
        }
        case HeaderType::TIMESTAMP:
            return HeaderValue::fromTimestamp(Timestamp{static_cast<int64_t>(cur.u64("timestamp"))});
        case HeaderType::UUID: {
            const uint8_t* p = cur.take(16, "uuid");
            Uuid id;
            std::memcpy(id.data(), p, id.size());
            return HeaderValue::fromUuid(id);
        }
    }
    throw FrameCorruption("unknown header value type " + std::to_string(tag));
}

} // anonymous namespace

HeaderMap parseHeaderBlock(const uint8_t* data, size_t len) {
    HeaderMap headers;
    HeaderCursor cur(data, len);

    while (!cur.atEnd()) {
        uint8_t nameLen = cur.u8("name length");
        if (nameLen == 0)
            throw FrameCorruption("header name length cannot be zero");

        const uint8_t* namePtr = cur.take(nameLen, "name");
        std::string name(reinterpret_cast<const char*>(namePtr), nameLen);

        uint8_t tag = cur.u8("type tag");
        headers[std::move(name)] = readHeaderValue(cur, tag);
    }

    return headers;
}

FrameDecoder::FrameDecoder(uint32_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {
    buffer_.reserve(8192);
}

void FrameDecoder::feed(const uint8_t* data, size_t len) {
    if (failed_) {
        spdlog::debug("[FrameDecoder] Ignoring {} bytes fed after failure", len);
        return;
    }
    // Compact consumed bytes lazily instead of erasing after every frame
    if (head_ > 0 && head_ >= buffer_.size() / 2) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + head_);
        head_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + len);
}

void FrameDecoder::fail(const std::string& reason) {
    failed_ = true;
    spdlog::error("[FrameDecoder] {} ({} bytes buffered, {} frames decoded)",
                  reason, buffered(), frames_decoded_);
    throw FrameCorruption(reason);
}

std::optional<Frame> FrameDecoder::tryExtractFrame() {
    if (failed_)
        throw FrameCorruption("decoder already failed; stream offset is untrusted");

    if (buffered() < PRELUDE_LENGTH)
        return std::nullopt;

    const uint8_t* data = buffer_.data() + head_;
    uint32_t totalLen = readUint32BE(data);
    uint32_t headersLen = readUint32BE(data + 4);
    uint32_t preludeCrc = readUint32BE(data + 8);

    if (crc32(data, 8) != preludeCrc)
        fail("prelude checksum mismatch");

    if (totalLen < MIN_FRAME_LENGTH)
        fail("declared total length " + std::to_string(totalLen) + " below minimum");

    if (totalLen > max_frame_bytes_)
        fail("declared total length " + std::to_string(totalLen) +
             " exceeds limit " + std::to_string(max_frame_bytes_));

    if (headersLen > totalLen - MIN_FRAME_LENGTH)
        fail("headers length " + std::to_string(headersLen) + " exceeds frame body");

    if (buffered() < totalLen)
        return std::nullopt;  // Wait for more data

    uint32_t messageCrc = readUint32BE(data + totalLen - TRAILER_LENGTH);
    if (crc32(data, totalLen - TRAILER_LENGTH) != messageCrc)
        fail("message checksum mismatch");

    Frame frame;
    frame.total_length = totalLen;
    frame.headers_length = headersLen;
    frame.prelude_crc = preludeCrc;
    frame.message_crc = messageCrc;

    try {
        frame.headers = parseHeaderBlock(data + PRELUDE_LENGTH, headersLen);
    } catch (const FrameCorruption& e) {
        failed_ = true;
        spdlog::error("[FrameDecoder] {}", e.what());
        throw;
    }

    const uint8_t* payloadBegin = data + PRELUDE_LENGTH + headersLen;
    const uint8_t* payloadEnd = data + totalLen - TRAILER_LENGTH;
    frame.payload.assign(payloadBegin, payloadEnd);

    // Keep the residual tail for the next call
    head_ += totalLen;
    if (head_ == buffer_.size()) {
        buffer_.clear();
        head_ = 0;
    }
    ++frames_decoded_;

    return frame;
}

} // namespace StreamBridge
