#include <streambridge/core/events/canonical_event.hpp>
#include <type_traits>

namespace {

template <typename>
inline constexpr bool always_false_v = false;

} // anonymous namespace

namespace StreamBridge {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FRAME_CORRUPTION:   return "frame_corruption";
        case ErrorKind::PROTOCOL_VIOLATION: return "protocol_violation";
        case ErrorKind::VENDOR_ERROR:       return "vendor_error";
        case ErrorKind::TRANSPORT:          return "transport_error";
    }
    return "unknown_error";
}

const char* canonicalEventName(const CanonicalEvent& e) {
    return std::visit([](const auto& ev) -> const char* {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, StreamStart>) return "stream-start";
        else if constexpr (std::is_same_v<T, BlockStart>) return "block-start";
        else if constexpr (std::is_same_v<T, ContentDelta>) return "content-delta";
        else if constexpr (std::is_same_v<T, InputJsonDelta>) return "input-json-delta";
        else if constexpr (std::is_same_v<T, BlockStop>) return "block-stop";
        else if constexpr (std::is_same_v<T, StreamStop>) return "stream-stop";
        else if constexpr (std::is_same_v<T, StreamError>) return "error";
        else static_assert(always_false_v<T>, "unnamed canonical event");
    }, e);
}

} // namespace StreamBridge
