#include <streambridge/core/translate/event_translator.hpp>
#include <spdlog/spdlog.h>
#include <type_traits>
#include <variant>

namespace StreamBridge {

namespace {

template <typename>
inline constexpr bool always_false_v = false;

const char* blockKindName(BlockKind kind) {
    return kind == BlockKind::TOOL_USE ? "tool_use" : "text";
}

} // anonymous namespace

const char* translatorStateName(TranslatorState s) {
    switch (s) {
        case TranslatorState::NOT_STARTED: return "NOT_STARTED";
        case TranslatorState::STREAMING:   return "STREAMING";
        case TranslatorState::TERMINATED:  return "TERMINATED";
    }
    return "UNKNOWN";
}

EventTranslator::EventTranslator(TranslatorOptions options, TokenCounterPtr counter)
    : options_(std::move(options)), counter_(std::move(counter)) {
    if (!counter_) {
        counter_ = std::make_shared<HeuristicTokenCounter>();
    }
}

CanonicalEvents EventTranslator::translate(const VendorEvent& event) {
    CanonicalEvents out;
    if (terminated()) {
        spdlog::debug("[Translator] Dropping {} after termination", vendorEventName(event));
        return out;
    }

    std::visit([this, &out](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ConversationStarted>) {
            onConversationStarted(e, out);
        } else if constexpr (std::is_same_v<T, AssistantResponseFragment>) {
            onAssistantFragment(e, out);
        } else if constexpr (std::is_same_v<T, ToolUseFragment>) {
            onToolUse(e, out);
        } else if constexpr (std::is_same_v<T, AssistantResponseEnd>) {
            spdlog::info("[Translator] assistantResponseEnd received, closing stream {}",
                         session_.conversation_id);
            if (ensureStarted("assistantResponseEnd", out)) {
                closeOpenBlock(out);
                emitStreamStop(out);
            }
        } else if constexpr (std::is_same_v<T, VendorError>) {
            onVendorError(e, out);
        } else if constexpr (std::is_same_v<T, UnrecognizedEvent>) {
            onUnrecognized(e);
        } else {
            static_assert(always_false_v<T>, "unhandled vendor event");
        }
    }, event);

    return out;
}

CanonicalEvents EventTranslator::finish() {
    CanonicalEvents out;
    switch (state_) {
        case TranslatorState::TERMINATED:
            break;
        case TranslatorState::NOT_STARTED:
            emitError(ErrorKind::PROTOCOL_VIOLATION,
                      "stream ended before conversation start", out);
            break;
        case TranslatorState::STREAMING:
            closeOpenBlock(out);
            emitStreamStop(out);
            break;
    }
    return out;
}

CanonicalEvents EventTranslator::fail(ErrorKind kind, const std::string& message) {
    CanonicalEvents out;
    if (!terminated()) {
        emitError(kind, message, out);
    }
    return out;
}

void EventTranslator::onConversationStarted(const ConversationStarted& e, CanonicalEvents& out) {
    if (state_ != TranslatorState::NOT_STARTED) {
        spdlog::warn("[Translator] Duplicate conversation start '{}' ignored (active '{}')",
                     e.conversation_id, session_.conversation_id);
        return;
    }
    session_.conversation_id = e.conversation_id;
    emitStreamStart(out);
}

void EventTranslator::onAssistantFragment(const AssistantResponseFragment& e, CanonicalEvents& out) {
    if (!ensureStarted("assistantResponseEvent", out))
        return;

    if (session_.content_block_open && session_.open_block_kind != BlockKind::TEXT)
        closeOpenBlock(out);

    if (!session_.content_block_open)
        openBlock(BlockKind::TEXT, out);

    if (e.content.empty())
        return;

    session_.response_text += e.content;
    out.push_back(ContentDelta{session_.block_index, e.content});
}

void EventTranslator::onToolUse(const ToolUseFragment& e, CanonicalEvents& out) {
    if (!ensureStarted("toolUseEvent", out))
        return;

    if (!session_.current_tool_use) {
        if (e.tool_use_id.empty() || e.name.empty()) {
            spdlog::warn("[Translator] toolUseEvent without an active tool use ignored (id='{}')",
                         e.tool_use_id);
            return;
        }
        closeOpenBlock(out);
        spdlog::info("[Translator] Starting tool use {} (id={})", e.name, e.tool_use_id);
        session_.current_tool_use = ToolUseState{e.tool_use_id, e.name, {}};
        openBlock(BlockKind::TOOL_USE, out, e.tool_use_id, e.name);
    }

    if (!e.input.empty()) {
        session_.current_tool_use->input += e.input;
        out.push_back(InputJsonDelta{session_.block_index, e.input});
    }

    if (e.stop) {
        spdlog::info("[Translator] Completed tool use {} (id={}, {} input bytes)",
                     session_.current_tool_use->name,
                     session_.current_tool_use->tool_use_id,
                     session_.current_tool_use->input.size());
        closeOpenBlock(out);
    }
}

void EventTranslator::onVendorError(const VendorError& e, CanonicalEvents& out) {
    spdlog::error("[Translator] Vendor error {}: {}", e.code, e.message);
    std::string message = e.code.empty() ? e.message : e.code + ": " + e.message;
    emitError(ErrorKind::VENDOR_ERROR, message, out);
}

void EventTranslator::onUnrecognized(const UnrecognizedEvent& e) {
    ++session_.unrecognized_events;
    spdlog::info("[Translator] Skipping unrecognized event type '{}'", e.event_type);
}

bool EventTranslator::ensureStarted(const char* what, CanonicalEvents& out) {
    if (state_ == TranslatorState::STREAMING)
        return true;

    if (options_.allow_missing_start) {
        spdlog::warn("[Translator] {} before conversation start, using placeholder id", what);
        session_.conversation_id = "unknown";
        emitStreamStart(out);
        return true;
    }

    emitError(ErrorKind::PROTOCOL_VIOLATION,
              std::string(what) + " received before conversation start", out);
    return false;
}

void EventTranslator::openBlock(BlockKind kind, CanonicalEvents& out,
                                const std::string& toolUseId, const std::string& toolName) {
    ++session_.block_index;
    session_.content_block_open = true;
    session_.open_block_kind = kind;
    spdlog::debug("[Translator] Block {} opened ({})", session_.block_index, blockKindName(kind));
    out.push_back(BlockStart{session_.block_index, kind, toolUseId, toolName});
}

void EventTranslator::closeOpenBlock(CanonicalEvents& out) {
    if (!session_.content_block_open)
        return;
    session_.content_block_open = false;
    session_.current_tool_use.reset();
    spdlog::debug("[Translator] Block {} closed", session_.block_index);
    out.push_back(BlockStop{session_.block_index});
}

void EventTranslator::emitStreamStart(CanonicalEvents& out) {
    state_ = TranslatorState::STREAMING;
    spdlog::info("[Translator] Stream started, conversation {}", session_.conversation_id);
    out.push_back(StreamStart{session_.conversation_id, options_.model, options_.input_tokens});
}

void EventTranslator::emitStreamStop(CanonicalEvents& out) {
    state_ = TranslatorState::TERMINATED;
    StreamStop stop;
    stop.input_tokens = options_.input_tokens;
    stop.output_tokens = counter_->count(session_.response_text);
    spdlog::info("[Translator] Stream {} stopped ({} blocks, ~{} output tokens)",
                 session_.conversation_id, session_.block_index + 1, stop.output_tokens);
    out.push_back(std::move(stop));
}

void EventTranslator::emitError(ErrorKind kind, const std::string& message, CanonicalEvents& out) {
    state_ = TranslatorState::TERMINATED;
    spdlog::warn("[Translator] Stream {} terminated with {}: {}",
                 session_.conversation_id, errorKindName(kind), message);
    out.push_back(StreamError{kind, message});
}

} // namespace StreamBridge
