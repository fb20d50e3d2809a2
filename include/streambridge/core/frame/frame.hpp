#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace StreamBridge {

namespace HeaderNames {
    inline const std::string EVENT_TYPE = ":event-type";
    inline const std::string CONTENT_TYPE = ":content-type";
    inline const std::string MESSAGE_TYPE = ":message-type";
    inline const std::string EXCEPTION_TYPE = ":exception-type";
    inline const std::string ERROR_CODE = ":error-code";
    inline const std::string ERROR_MESSAGE = ":error-message";
}

/**
 * Wire type tags of the compact header encoding.
 */
enum class HeaderType : uint8_t {
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

struct Timestamp {
    int64_t millis_since_epoch = 0;
    bool operator==(const Timestamp& o) const { return millis_since_epoch == o.millis_since_epoch; }
    bool operator!=(const Timestamp& o) const { return !(*this == o); }
};

using Uuid = std::array<uint8_t, 16>;
using ByteBuffer = std::vector<uint8_t>;

/**
 * @brief One typed header value.
 *
 * The wire tag is kept next to the value: BOOL_TRUE/BOOL_FALSE share the
 * bool alternative.
 */
struct HeaderValue {
    using Storage = std::variant<bool, int8_t, int16_t, int32_t, int64_t,
                                 ByteBuffer, std::string, Timestamp, Uuid>;

    HeaderType type = HeaderType::STRING;
    Storage value{std::string()};

    static HeaderValue fromBool(bool v) {
        return {v ? HeaderType::BOOL_TRUE : HeaderType::BOOL_FALSE, v};
    }
    static HeaderValue fromByte(int8_t v) { return {HeaderType::BYTE, v}; }
    static HeaderValue fromShort(int16_t v) { return {HeaderType::SHORT, v}; }
    static HeaderValue fromInt32(int32_t v) { return {HeaderType::INTEGER, v}; }
    static HeaderValue fromInt64(int64_t v) { return {HeaderType::LONG, v}; }
    static HeaderValue fromBytes(ByteBuffer v) { return {HeaderType::BYTE_ARRAY, std::move(v)}; }
    static HeaderValue fromString(std::string v) { return {HeaderType::STRING, std::move(v)}; }
    static HeaderValue fromTimestamp(Timestamp v) { return {HeaderType::TIMESTAMP, v}; }
    static HeaderValue fromUuid(const Uuid& v) { return {HeaderType::UUID, v}; }

    const std::string* asString() const { return std::get_if<std::string>(&value); }

    bool operator==(const HeaderValue& o) const { return type == o.type && value == o.value; }
    bool operator!=(const HeaderValue& o) const { return !(*this == o); }
};

using HeaderMap = std::unordered_map<std::string, HeaderValue>;

/**
 * @brief One validated event-stream message.
 *
 * Only produced by FrameDecoder after both checksums passed.
 */
struct Frame {
    uint32_t total_length = 0;
    uint32_t headers_length = 0;
    uint32_t prelude_crc = 0;
    HeaderMap headers;
    std::vector<uint8_t> payload;
    uint32_t message_crc = 0;

    /**
     * @brief String value of a header, if present and of string type
     */
    std::optional<std::string> headerString(const std::string& name) const {
        auto it = headers.find(name);
        if (it == headers.end()) return std::nullopt;
        if (const std::string* s = it->second.asString()) return *s;
        return std::nullopt;
    }

    std::string payloadText() const {
        return std::string(payload.begin(), payload.end());
    }
};

// Layout constants
constexpr size_t PRELUDE_LENGTH = 12;     // total_length + headers_length + prelude_crc
constexpr size_t TRAILER_LENGTH = 4;      // message_crc
constexpr size_t MIN_FRAME_LENGTH = PRELUDE_LENGTH + TRAILER_LENGTH;

} // namespace StreamBridge
