#include <streambridge/core/frame/crc32.hpp>
#include <mutex>

namespace StreamBridge {

uint32_t crc32(const uint8_t* data, size_t len) {
    static uint32_t CRC32_TABLE[256];
    static std::once_flag init_flag;

    std::call_once(init_flag, []() {
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t crc = i;
            for (int j = 0; j < 8; j++) {
                if (crc & 1)
                    crc = (crc >> 1) ^ 0xEDB88320;
                else
                    crc >>= 1;
            }
            CRC32_TABLE[i] = crc;
        }
    });

    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = (crc >> 8) ^ CRC32_TABLE[(crc ^ data[i]) & 0xFF];
    }
    return crc ^ 0xFFFFFFFF;
}

} // namespace StreamBridge
