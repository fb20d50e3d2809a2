#pragma once
#include <streambridge/core/frame/frame.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace StreamBridge {

using HeaderList = std::vector<std::pair<std::string, HeaderValue>>;

/**
 * @brief Serialize headers and payload into one wire-exact frame
 *
 * Headers are written in list order. Used for fixtures, tests and the
 * decoder benchmark.
 *
 * @throws std::invalid_argument if a header name exceeds 255 bytes or a
 *         string/byte-array value exceeds 65535 bytes
 */
std::vector<uint8_t> encodeFrame(const HeaderList& headers, const std::vector<uint8_t>& payload);

std::vector<uint8_t> encodeFrame(const HeaderList& headers, const std::string& payload);

/**
 * @brief Convenience for the common vendor shape: event-type + JSON payload
 */
std::vector<uint8_t> encodeEventFrame(const std::string& eventType, const std::string& jsonPayload);

} // namespace StreamBridge
