#pragma once
#include <streambridge/core/events/canonical_event.hpp>
#include <streambridge/core/events/vendor_event.hpp>
#include <streambridge/core/translate/token_counter.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace StreamBridge {

struct TranslatorOptions {
    std::string model = "claude-sonnet-4.5";
    uint32_t input_tokens = 0;
    // Synthesize a placeholder stream-start when content arrives first
    // instead of failing with a protocol violation.
    bool allow_missing_start = false;
};

enum class TranslatorState : uint8_t {
    NOT_STARTED = 0,
    STREAMING = 1,
    TERMINATED = 2
};

const char* translatorStateName(TranslatorState s);

struct ToolUseState {
    std::string tool_use_id;
    std::string name;
    std::string input;  // accumulated fragments
};

/**
 * Per-response bookkeeping of which structural events were already emitted.
 */
struct TranslationSession {
    std::string conversation_id;
    bool content_block_open = false;
    BlockKind open_block_kind = BlockKind::TEXT;
    int block_index = -1;  // index of the current or last opened block
    std::optional<ToolUseState> current_tool_use;
    std::string response_text;
    uint64_t unrecognized_events = 0;
};

/**
 * @class EventTranslator
 * @brief State machine from vendor events to the canonical event sequence.
 *
 * NOT_STARTED -> STREAMING on ConversationStarted (emits stream-start).
 * Text and tool fragments open a block on first use, so block-start always
 * precedes the first delta. finish() or AssistantResponseEnd closes any
 * open block and emits stream-stop; VendorError or fail() emits a single
 * error event. Exactly one terminal event is produced, after which every
 * call returns an empty sequence.
 *
 * Owned by one connection; not thread-safe.
 */
class EventTranslator {
public:
    explicit EventTranslator(TranslatorOptions options = {},
                             TokenCounterPtr counter = nullptr);

    CanonicalEvents translate(const VendorEvent& event);

    /**
     * @brief End of the frame stream (transport EOF)
     */
    CanonicalEvents finish();

    /**
     * @brief Terminate with an error raised outside the translator
     *        (decoder corruption, payload shape, transport failure)
     */
    CanonicalEvents fail(ErrorKind kind, const std::string& message);

    TranslatorState state() const { return state_; }
    bool terminated() const { return state_ == TranslatorState::TERMINATED; }
    const TranslationSession& session() const { return session_; }

private:
    void onConversationStarted(const ConversationStarted& e, CanonicalEvents& out);
    void onAssistantFragment(const AssistantResponseFragment& e, CanonicalEvents& out);
    void onToolUse(const ToolUseFragment& e, CanonicalEvents& out);
    void onVendorError(const VendorError& e, CanonicalEvents& out);
    void onUnrecognized(const UnrecognizedEvent& e);

    // Returns false (and terminates with an error) if the stream cannot proceed
    bool ensureStarted(const char* what, CanonicalEvents& out);
    void openBlock(BlockKind kind, CanonicalEvents& out,
                   const std::string& toolUseId = {}, const std::string& toolName = {});
    void closeOpenBlock(CanonicalEvents& out);
    void emitStreamStart(CanonicalEvents& out);
    void emitStreamStop(CanonicalEvents& out);
    void emitError(ErrorKind kind, const std::string& message, CanonicalEvents& out);

    TranslatorOptions options_;
    TokenCounterPtr counter_;
    TranslatorState state_ = TranslatorState::NOT_STARTED;
    TranslationSession session_;
};

} // namespace StreamBridge
