#pragma once
#include <streambridge/core/frame/frame.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace StreamBridge {

/**
 * Vendor event kinds understood by the translator, resolved once from the
 * :event-type header.
 */
enum class VendorEventKind {
    CONVERSATION_STARTED,     // initial-response
    ASSISTANT_FRAGMENT,       // assistantResponseEvent
    TOOL_USE,                 // toolUseEvent
    ASSISTANT_RESPONSE_END,   // assistantResponseEnd
    UNRECOGNIZED
};

VendorEventKind classifyEventType(std::string_view eventType);

struct ConversationStarted {
    std::string conversation_id;
};

struct AssistantResponseFragment {
    std::string content;
};

/**
 * One toolUseEvent record. The vendor streams the tool input as string
 * fragments; object inputs are kept as compact JSON text.
 */
struct ToolUseFragment {
    std::string tool_use_id;
    std::string name;
    std::string input;
    bool stop = false;
};

struct AssistantResponseEnd {};

struct VendorError {
    std::string code;
    std::string message;
};

struct UnrecognizedEvent {
    std::string event_type;
};

using VendorEvent = std::variant<ConversationStarted,
                                 AssistantResponseFragment,
                                 ToolUseFragment,
                                 AssistantResponseEnd,
                                 VendorError,
                                 UnrecognizedEvent>;

/**
 * @brief Map a validated frame to a vendor event
 *
 * :message-type "error" and "exception" become VendorError; everything
 * else dispatches on :event-type.
 *
 * @throws ProtocolViolation if a recognized event carries a payload that is
 *         not a JSON object
 */
VendorEvent parseVendorEvent(const Frame& frame);

const char* vendorEventName(const VendorEvent& event);

} // namespace StreamBridge
