#include <streambridge/core/frame/frame_encoder.hpp>
#include <streambridge/core/frame/crc32.hpp>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace StreamBridge {

namespace {

inline void writeUint16BE(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void writeUint32BE(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void writeUint64BE(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
    }
}

inline void writeSized(std::vector<uint8_t>& out, const uint8_t* p, size_t n) {
    if (n > 0xFFFF)
        throw std::invalid_argument("header value longer than 65535 bytes");
    writeUint16BE(out, static_cast<uint16_t>(n));
    out.insert(out.end(), p, p + n);
}

void writeHeader(std::vector<uint8_t>& out, const std::string& name, const HeaderValue& hv) {
    if (name.empty() || name.size() > 0xFF)
        throw std::invalid_argument("header name must be 1..255 bytes: '" + name + "'");

    out.push_back(static_cast<uint8_t>(name.size()));
    out.insert(out.end(), name.begin(), name.end());
    out.push_back(static_cast<uint8_t>(hv.type));

    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            // Encoded in the type tag
        } else if constexpr (std::is_same_v<T, int8_t>) {
            out.push_back(static_cast<uint8_t>(v));
        } else if constexpr (std::is_same_v<T, int16_t>) {
            writeUint16BE(out, static_cast<uint16_t>(v));
        } else if constexpr (std::is_same_v<T, int32_t>) {
            writeUint32BE(out, static_cast<uint32_t>(v));
        } else if constexpr (std::is_same_v<T, int64_t>) {
            writeUint64BE(out, static_cast<uint64_t>(v));
        } else if constexpr (std::is_same_v<T, ByteBuffer>) {
            writeSized(out, v.data(), v.size());
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeSized(out, reinterpret_cast<const uint8_t*>(v.data()), v.size());
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            writeUint64BE(out, static_cast<uint64_t>(v.millis_since_epoch));
        } else if constexpr (std::is_same_v<T, Uuid>) {
            out.insert(out.end(), v.begin(), v.end());
        }
    }, hv.value);
}

} // anonymous namespace

std::vector<uint8_t> encodeFrame(const HeaderList& headers, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> headerBlock;
    for (const auto& [name, value] : headers) {
        writeHeader(headerBlock, name, value);
    }

    uint32_t totalLen = static_cast<uint32_t>(MIN_FRAME_LENGTH + headerBlock.size() + payload.size());

    std::vector<uint8_t> frame;
    frame.reserve(totalLen);
    writeUint32BE(frame, totalLen);
    writeUint32BE(frame, static_cast<uint32_t>(headerBlock.size()));
    writeUint32BE(frame, crc32(frame.data(), 8));
    frame.insert(frame.end(), headerBlock.begin(), headerBlock.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    writeUint32BE(frame, crc32(frame.data(), frame.size()));

    return frame;
}

std::vector<uint8_t> encodeFrame(const HeaderList& headers, const std::string& payload) {
    return encodeFrame(headers, std::vector<uint8_t>(payload.begin(), payload.end()));
}

std::vector<uint8_t> encodeEventFrame(const std::string& eventType, const std::string& jsonPayload) {
    HeaderList headers = {
        {HeaderNames::EVENT_TYPE, HeaderValue::fromString(eventType)},
        {HeaderNames::CONTENT_TYPE, HeaderValue::fromString("application/json")},
        {HeaderNames::MESSAGE_TYPE, HeaderValue::fromString("event")},
    };
    return encodeFrame(headers, jsonPayload);
}

} // namespace StreamBridge
