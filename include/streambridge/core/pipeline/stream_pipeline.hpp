#pragma once
#include <streambridge/core/frame/frame_decoder.hpp>
#include <streambridge/core/translate/event_translator.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace StreamBridge {

struct PipelineStats {
    uint64_t bytes_fed = 0;
    uint64_t frames_decoded = 0;
    uint64_t events_emitted = 0;
    uint64_t unrecognized_events = 0;
};

/**
 * @class StreamPipeline
 * @brief Decoder + translator pair servicing one streaming response.
 *
 * onBytes() pushes a chunk through the decoder and translates every
 * complete frame; onEof() closes the stream. Decoder corruption and
 * malformed payloads become a single terminal error event instead of
 * propagating, so the consumer always sees a clean end of stream.
 */
class StreamPipeline {
public:
    explicit StreamPipeline(TranslatorOptions options = {},
                            uint32_t max_frame_bytes = FrameDecoder::DEFAULT_MAX_FRAME_BYTES,
                            TokenCounterPtr counter = nullptr);

    CanonicalEvents onBytes(const uint8_t* data, size_t len);
    CanonicalEvents onBytes(const std::vector<uint8_t>& chunk) {
        return onBytes(chunk.data(), chunk.size());
    }

    /**
     * @brief Transport reached end of input
     */
    CanonicalEvents onEof();

    /**
     * @brief Transport failed before end of input
     */
    CanonicalEvents onTransportError(const std::string& message);

    bool terminated() const { return translator_.terminated(); }
    const FrameDecoder& decoder() const { return decoder_; }
    const EventTranslator& translator() const { return translator_; }
    PipelineStats stats() const;

private:
    void drainFrames(CanonicalEvents& out);
    void append(CanonicalEvents& out, CanonicalEvents&& events);

    FrameDecoder decoder_;
    EventTranslator translator_;
    uint64_t bytes_fed_ = 0;
    uint64_t events_emitted_ = 0;
};

/**
 * Single-mutex guard for callers that deliver chunks from several threads.
 * Chunk order is still the caller's responsibility.
 */
class SynchronizedPipeline {
public:
    explicit SynchronizedPipeline(TranslatorOptions options = {},
                                  uint32_t max_frame_bytes = FrameDecoder::DEFAULT_MAX_FRAME_BYTES)
        : pipeline_(std::move(options), max_frame_bytes) {}

    CanonicalEvents onBytes(const uint8_t* data, size_t len) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pipeline_.onBytes(data, len);
    }

    CanonicalEvents onEof() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pipeline_.onEof();
    }

    CanonicalEvents onTransportError(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pipeline_.onTransportError(message);
    }

    bool terminated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pipeline_.terminated();
    }

    PipelineStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pipeline_.stats();
    }

private:
    mutable std::mutex mutex_;
    StreamPipeline pipeline_;
};

} // namespace StreamBridge
