#include <streambridge/core/events/vendor_event.hpp>
#include <streambridge/core/errors.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <type_traits>
#include <variant>

namespace StreamBridge {

namespace {

using json = nlohmann::json;

template <typename>
inline constexpr bool always_false_v = false;

json parsePayloadObject(const Frame& frame, const std::string& eventType) {
    if (frame.payload.empty())
        return json::object();

    json doc = json::parse(frame.payload.begin(), frame.payload.end(), nullptr, false);
    if (doc.is_discarded())
        throw ProtocolViolation("payload of '" + eventType + "' is not valid JSON");
    if (!doc.is_object())
        throw ProtocolViolation("payload of '" + eventType + "' is not a JSON object");
    return doc;
}

// Absent or null fields read as empty; any other non-string is a shape error.
std::string stringField(const json& obj, const char* key, const std::string& eventType) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return {};
    if (!it->is_string())
        throw ProtocolViolation("field '" + std::string(key) + "' of '" + eventType + "' is not a string");
    return it->get<std::string>();
}

VendorError parseErrorFrame(const Frame& frame, const std::string& messageType) {
    VendorError err;

    if (messageType == "exception") {
        err.code = frame.headerString(HeaderNames::EXCEPTION_TYPE).value_or("exception");
        json doc = json::parse(frame.payload.begin(), frame.payload.end(), nullptr, false);
        if (!doc.is_discarded() && doc.is_object()) {
            auto it = doc.find("message");
            if (it != doc.end() && it->is_string()) {
                err.message = it->get<std::string>();
            }
        }
        if (err.message.empty())
            err.message = frame.payloadText();
    } else {
        err.code = frame.headerString(HeaderNames::ERROR_CODE).value_or("error");
        err.message = frame.headerString(HeaderNames::ERROR_MESSAGE).value_or(frame.payloadText());
    }

    return err;
}

} // anonymous namespace

VendorEventKind classifyEventType(std::string_view eventType) {
    if (eventType == "initial-response") return VendorEventKind::CONVERSATION_STARTED;
    if (eventType == "assistantResponseEvent") return VendorEventKind::ASSISTANT_FRAGMENT;
    if (eventType == "toolUseEvent") return VendorEventKind::TOOL_USE;
    if (eventType == "assistantResponseEnd") return VendorEventKind::ASSISTANT_RESPONSE_END;
    return VendorEventKind::UNRECOGNIZED;
}

VendorEvent parseVendorEvent(const Frame& frame) {
    auto messageType = frame.headerString(HeaderNames::MESSAGE_TYPE);
    if (messageType && (*messageType == "error" || *messageType == "exception")) {
        return parseErrorFrame(frame, *messageType);
    }

    auto eventType = frame.headerString(HeaderNames::EVENT_TYPE);
    if (!eventType) {
        return UnrecognizedEvent{""};
    }

    switch (classifyEventType(*eventType)) {
        case VendorEventKind::CONVERSATION_STARTED: {
            json body = parsePayloadObject(frame, *eventType);
            return ConversationStarted{stringField(body, "conversationId", *eventType)};
        }
        case VendorEventKind::ASSISTANT_FRAGMENT: {
            json body = parsePayloadObject(frame, *eventType);
            return AssistantResponseFragment{stringField(body, "content", *eventType)};
        }
        case VendorEventKind::TOOL_USE: {
            json body = parsePayloadObject(frame, *eventType);
            ToolUseFragment tool;
            tool.tool_use_id = stringField(body, "toolUseId", *eventType);
            tool.name = stringField(body, "name", *eventType);

            auto input = body.find("input");
            if (input != body.end()) {
                if (input->is_string()) {
                    tool.input = input->get<std::string>();
                } else if (input->is_object() && !input->empty()) {
                    tool.input = input->dump();
                } else if (!input->is_null() && !input->is_object()) {
                    spdlog::warn("[VendorEvent] Unexpected toolUseEvent input type '{}'", input->type_name());
                    tool.input = input->dump();
                }
            }

            auto stop = body.find("stop");
            tool.stop = stop != body.end() && stop->is_boolean() && stop->get<bool>();
            return tool;
        }
        case VendorEventKind::ASSISTANT_RESPONSE_END:
            return AssistantResponseEnd{};
        case VendorEventKind::UNRECOGNIZED:
            break;
    }

    return UnrecognizedEvent{*eventType};
}

const char* vendorEventName(const VendorEvent& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ConversationStarted>) return "ConversationStarted";
        else if constexpr (std::is_same_v<T, AssistantResponseFragment>) return "AssistantResponseFragment";
        else if constexpr (std::is_same_v<T, ToolUseFragment>) return "ToolUseFragment";
        else if constexpr (std::is_same_v<T, AssistantResponseEnd>) return "AssistantResponseEnd";
        else if constexpr (std::is_same_v<T, VendorError>) return "VendorError";
        else if constexpr (std::is_same_v<T, UnrecognizedEvent>) return "UnrecognizedEvent";
        else static_assert(always_false_v<T>, "unnamed vendor event");
    }, event);
}

} // namespace StreamBridge
