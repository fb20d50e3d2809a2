#pragma once
#include <streambridge/core/pipeline/event_sink.hpp>
#include <streambridge/core/pipeline/stream_pipeline.hpp>
#include <atomic>
#include <cstddef>
#include <string>

namespace StreamBridge {

/**
 * @class FdStreamPump
 * @brief Blocking read loop that drives one StreamPipeline from a file descriptor.
 *
 * Reads chunk_size bytes at a time until EOF, a read error, termination of
 * the stream or stop(). Every batch of canonical events goes to the sink as
 * soon as it is produced. The descriptor is not closed by the pump.
 */
class FdStreamPump {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

    FdStreamPump(StreamPipeline& pipeline, EventSink& sink,
                 size_t chunk_size = DEFAULT_CHUNK_SIZE, std::string source_name = "fd");

    /**
     * @brief Pump until the stream terminates
     * @return true if the stream ended with a terminal event
     */
    bool run(int fd);

    /**
     * @brief Request the loop to exit after the current read
     *
     * Sticky: a stop requested before run() makes run() return without reading.
     */
    void stop() { stop_requested_.store(true, std::memory_order_release); }

    uint64_t chunksRead() const { return chunks_read_; }

private:
    void deliver(const CanonicalEvents& events);

    StreamPipeline& pipeline_;
    EventSink& sink_;
    size_t chunk_size_;
    std::string source_name_;
    std::atomic<bool> stop_requested_{false};
    uint64_t chunks_read_ = 0;
};

} // namespace StreamBridge
