#pragma once
#include <streambridge/core/events/canonical_event.hpp>
#include <string>

namespace StreamBridge {

/**
 * @brief Serialize one canonical event as Claude Messages SSE records.
 *
 * Each record is "event: <name>\ndata: <json>\n\n". StreamStop expands to
 * two records (message_delta carrying stop_reason/usage, then message_stop).
 */
std::string toSse(const CanonicalEvent& event);

std::string toSse(const CanonicalEvents& events);

} // namespace StreamBridge
