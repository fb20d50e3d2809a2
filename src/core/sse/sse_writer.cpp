#include <streambridge/core/sse/sse_writer.hpp>
#include <nlohmann/json.hpp>
#include <type_traits>
#include <variant>

namespace StreamBridge {

namespace {

using json = nlohmann::json;

void appendRecord(std::string& out, const char* name, const json& data) {
    out += "event: ";
    out += name;
    out += "\ndata: ";
    // Vendor text is not validated upstream; invalid UTF-8 becomes U+FFFD
    out += data.dump(-1, ' ', false, json::error_handler_t::replace);
    out += "\n\n";
}

json messageStart(const StreamStart& e) {
    return {
        {"type", "message_start"},
        {"message", {
            {"id", e.conversation_id},
            {"type", "message"},
            {"role", "assistant"},
            {"content", json::array()},
            {"model", e.model},
            {"stop_reason", nullptr},
            {"stop_sequence", nullptr},
            {"usage", {{"input_tokens", e.input_tokens}, {"output_tokens", 0}}}
        }}
    };
}

json blockStart(const BlockStart& e) {
    json block;
    if (e.kind == BlockKind::TOOL_USE) {
        block = {{"type", "tool_use"}, {"id", e.tool_use_id}, {"name", e.tool_name},
                 {"input", json::object()}};
    } else {
        block = {{"type", "text"}, {"text", ""}};
    }
    return {{"type", "content_block_start"}, {"index", e.index}, {"content_block", block}};
}

} // anonymous namespace

std::string toSse(const CanonicalEvent& event) {
    std::string out;

    std::visit([&out](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, StreamStart>) {
            appendRecord(out, "message_start", messageStart(e));
        } else if constexpr (std::is_same_v<T, BlockStart>) {
            appendRecord(out, "content_block_start", blockStart(e));
        } else if constexpr (std::is_same_v<T, ContentDelta>) {
            appendRecord(out, "content_block_delta", {
                {"type", "content_block_delta"}, {"index", e.index},
                {"delta", {{"type", "text_delta"}, {"text", e.text}}}});
        } else if constexpr (std::is_same_v<T, InputJsonDelta>) {
            appendRecord(out, "content_block_delta", {
                {"type", "content_block_delta"}, {"index", e.index},
                {"delta", {{"type", "input_json_delta"}, {"partial_json", e.partial_json}}}});
        } else if constexpr (std::is_same_v<T, BlockStop>) {
            appendRecord(out, "content_block_stop", {
                {"type", "content_block_stop"}, {"index", e.index}});
        } else if constexpr (std::is_same_v<T, StreamStop>) {
            appendRecord(out, "message_delta", {
                {"type", "message_delta"},
                {"delta", {{"stop_reason", e.stop_reason}, {"stop_sequence", nullptr}}},
                {"usage", {{"input_tokens", e.input_tokens}, {"output_tokens", e.output_tokens}}}});
            appendRecord(out, "message_stop", {{"type", "message_stop"}});
        } else if constexpr (std::is_same_v<T, StreamError>) {
            appendRecord(out, "error", {
                {"type", "error"},
                {"error", {{"type", errorKindName(e.kind)}, {"message", e.message}}}});
        }
    }, event);

    return out;
}

std::string toSse(const CanonicalEvents& events) {
    std::string out;
    for (const auto& e : events) {
        out += toSse(e);
    }
    return out;
}

} // namespace StreamBridge
