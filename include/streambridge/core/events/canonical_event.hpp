#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace StreamBridge {

enum class BlockKind : uint8_t {
    TEXT = 0,
    TOOL_USE = 1
};

enum class ErrorKind : uint8_t {
    FRAME_CORRUPTION = 0,
    PROTOCOL_VIOLATION = 1,
    VENDOR_ERROR = 2,
    TRANSPORT = 3
};

const char* errorKindName(ErrorKind kind);

struct StreamStart {
    std::string conversation_id;
    std::string model;
    uint32_t input_tokens = 0;
};

struct BlockStart {
    int index = 0;
    BlockKind kind = BlockKind::TEXT;
    std::string tool_use_id;  // TOOL_USE only
    std::string tool_name;    // TOOL_USE only
};

struct ContentDelta {
    int index = 0;
    std::string text;
};

struct InputJsonDelta {
    int index = 0;
    std::string partial_json;
};

struct BlockStop {
    int index = 0;
};

struct StreamStop {
    std::string stop_reason = "end_turn";
    uint32_t input_tokens = 0;
    uint32_t output_tokens = 0;
};

struct StreamError {
    ErrorKind kind = ErrorKind::PROTOCOL_VIOLATION;
    std::string message;
};

/**
 * One unit of the normalized output protocol. Ordering per stream:
 *   StreamStart (BlockStart Delta* BlockStop)* (StreamStop | StreamError)
 */
using CanonicalEvent = std::variant<StreamStart,
                                    BlockStart,
                                    ContentDelta,
                                    InputJsonDelta,
                                    BlockStop,
                                    StreamStop,
                                    StreamError>;

using CanonicalEvents = std::vector<CanonicalEvent>;

inline bool isTerminal(const CanonicalEvent& e) {
    return std::holds_alternative<StreamStop>(e) || std::holds_alternative<StreamError>(e);
}

/**
 * @brief Short name for logs and tests ("stream-start", "block-stop", ...)
 */
const char* canonicalEventName(const CanonicalEvent& e);

} // namespace StreamBridge
