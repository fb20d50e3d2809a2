#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace StreamBridge {

/**
 * @brief IEEE 802.3 CRC-32 (reflected, polynomial 0xEDB88320).
 *
 * Same checksum the event-stream wire format uses for both the prelude
 * and the whole-message trailer.
 */
uint32_t crc32(const uint8_t* data, size_t len);

inline uint32_t crc32(const std::vector<uint8_t>& data) {
    return crc32(data.data(), data.size());
}

} // namespace StreamBridge
