#include <streambridge/core/pipeline/stream_pipeline.hpp>
#include <spdlog/spdlog.h>

namespace StreamBridge {

StreamPipeline::StreamPipeline(TranslatorOptions options, uint32_t max_frame_bytes,
                               TokenCounterPtr counter)
    : decoder_(max_frame_bytes), translator_(std::move(options), std::move(counter)) {
}

CanonicalEvents StreamPipeline::onBytes(const uint8_t* data, size_t len) {
    CanonicalEvents out;
    if (terminated()) {
        spdlog::debug("[Pipeline] Ignoring {} bytes after stream termination", len);
        return out;
    }

    bytes_fed_ += len;
    decoder_.feed(data, len);
    drainFrames(out);
    return out;
}

CanonicalEvents StreamPipeline::onEof() {
    CanonicalEvents out;
    if (terminated())
        return out;

    if (decoder_.buffered() > 0) {
        spdlog::warn("[Pipeline] Stream closed with {} bytes of an incomplete frame",
                     decoder_.buffered());
        append(out, translator_.fail(ErrorKind::FRAME_CORRUPTION,
                                     "truncated frame at end of stream (" +
                                     std::to_string(decoder_.buffered()) + " bytes)"));
        return out;
    }

    append(out, translator_.finish());
    return out;
}

CanonicalEvents StreamPipeline::onTransportError(const std::string& message) {
    CanonicalEvents out;
    append(out, translator_.fail(ErrorKind::TRANSPORT, message));
    return out;
}

PipelineStats StreamPipeline::stats() const {
    PipelineStats s;
    s.bytes_fed = bytes_fed_;
    s.frames_decoded = decoder_.framesDecoded();
    s.events_emitted = events_emitted_;
    s.unrecognized_events = translator_.session().unrecognized_events;
    return s;
}

void StreamPipeline::drainFrames(CanonicalEvents& out) {
    while (!terminated()) {
        std::optional<Frame> frame;
        try {
            frame = decoder_.tryExtractFrame();
        } catch (const FrameCorruption& e) {
            append(out, translator_.fail(ErrorKind::FRAME_CORRUPTION, e.what()));
            return;
        }

        if (!frame)
            return;  // Wait for more data

        try {
            VendorEvent event = parseVendorEvent(*frame);
            spdlog::debug("[Pipeline] Frame {} bytes -> {}", frame->total_length, vendorEventName(event));
            append(out, translator_.translate(event));
        } catch (const ProtocolViolation& e) {
            append(out, translator_.fail(ErrorKind::PROTOCOL_VIOLATION, e.what()));
            return;
        }
    }
}

void StreamPipeline::append(CanonicalEvents& out, CanonicalEvents&& events) {
    events_emitted_ += events.size();
    for (auto& e : events) {
        out.push_back(std::move(e));
    }
}

} // namespace StreamBridge
