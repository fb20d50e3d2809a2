#pragma once
#include <streambridge/core/frame/frame.hpp>
#include <streambridge/core/errors.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace StreamBridge {

/**
 * @class FrameDecoder
 * @brief Incremental decoder for the binary event-stream wire format.
 *
 * Owns the accumulation buffer for one connection. Bytes arrive through
 * feed() in arbitrary chunks; tryExtractFrame() yields one validated frame
 * at a time or std::nullopt when more bytes are needed.
 *
 * Wire layout:
 *   [4B total_length][4B headers_length][4B prelude_crc]
 *   [headers_length B headers][payload][4B message_crc]
 *
 * A checksum or length failure throws FrameCorruption and leaves the
 * decoder in a failed state; every later extraction throws again.
 *
 * Not thread-safe: one decoder per connection, driven by its owner.
 */
class FrameDecoder {
public:
    static constexpr uint32_t DEFAULT_MAX_FRAME_BYTES = 16 * 1024 * 1024;

    explicit FrameDecoder(uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);

    /**
     * @brief Append newly received bytes to the buffer
     */
    void feed(const uint8_t* data, size_t len);
    void feed(const std::vector<uint8_t>& chunk) { feed(chunk.data(), chunk.size()); }

    /**
     * @brief Try to decode one frame from the buffered bytes
     * @return The frame, or std::nullopt if the buffer holds an incomplete frame
     * @throws FrameCorruption on checksum, length or header-encoding failure
     */
    std::optional<Frame> tryExtractFrame();

    size_t buffered() const { return buffer_.size() - head_; }
    bool failed() const { return failed_; }
    uint64_t framesDecoded() const { return frames_decoded_; }
    uint32_t maxFrameBytes() const { return max_frame_bytes_; }

private:
    [[noreturn]] void fail(const std::string& reason);

    std::vector<uint8_t> buffer_;
    size_t head_ = 0;  // start of the first unconsumed byte
    uint32_t max_frame_bytes_;
    bool failed_ = false;
    uint64_t frames_decoded_ = 0;
};

/**
 * @brief Parse a compact binary header block into a name/value map
 * @throws FrameCorruption if the block is truncated or carries an unknown type tag
 */
HeaderMap parseHeaderBlock(const uint8_t* data, size_t len);

} // namespace StreamBridge
