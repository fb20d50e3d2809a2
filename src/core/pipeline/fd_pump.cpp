#include <streambridge/core/pipeline/fd_pump.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace StreamBridge {

FdStreamPump::FdStreamPump(StreamPipeline& pipeline, EventSink& sink,
                           size_t chunk_size, std::string source_name)
    : pipeline_(pipeline), sink_(sink),
      chunk_size_(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size),
      source_name_(std::move(source_name)) {
}

void FdStreamPump::deliver(const CanonicalEvents& events) {
    if (!events.empty()) {
        sink_.onEvents(events);
    }
}

bool FdStreamPump::run(int fd) {
    std::vector<uint8_t> temp(chunk_size_);

    while (!stop_requested_.load(std::memory_order_acquire) && !pipeline_.terminated()) {
        ssize_t bytesRead = ::read(fd, temp.data(), temp.size());

        if (bytesRead < 0) {
            if (errno == EINTR)
                continue;
            std::string reason = std::strerror(errno);
            spdlog::error("[FdStreamPump] Read from {} failed: {}", source_name_, reason);
            deliver(pipeline_.onTransportError("read failed: " + reason));
            break;
        }

        if (bytesRead == 0) {
            spdlog::info("[FdStreamPump] {} reached end of input after {} chunks",
                         source_name_, chunks_read_);
            deliver(pipeline_.onEof());
            break;
        }

        ++chunks_read_;
        deliver(pipeline_.onBytes(temp.data(), static_cast<size_t>(bytesRead)));
    }

    auto stats = pipeline_.stats();
    spdlog::info("[FdStreamPump] {} done: {} bytes, {} frames, {} events, {} unrecognized",
                 source_name_, stats.bytes_fed, stats.frames_decoded,
                 stats.events_emitted, stats.unrecognized_events);
    return pipeline_.terminated();
}

} // namespace StreamBridge
