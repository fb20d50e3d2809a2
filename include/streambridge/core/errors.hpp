#pragma once
#include <stdexcept>
#include <string>

namespace StreamBridge {

/**
 * @brief Checksum, length or header-encoding failure in the inbound byte stream.
 *
 * Fatal for the connection: once thrown the decoder refuses to extract any
 * further frame because the next frame boundary can no longer be trusted.
 */
class FrameCorruption : public std::runtime_error {
public:
    explicit FrameCorruption(const std::string& what)
        : std::runtime_error("frame corruption: " + what) {}
};

/**
 * @brief Structurally invalid vendor stream (content before start, bad payload shape).
 */
class ProtocolViolation : public std::runtime_error {
public:
    explicit ProtocolViolation(const std::string& what)
        : std::runtime_error("protocol violation: " + what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace StreamBridge
