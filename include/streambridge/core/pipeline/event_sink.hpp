#pragma once
#include <streambridge/core/events/canonical_event.hpp>
#include <streambridge/core/sse/sse_writer.hpp>
#include <ostream>

namespace StreamBridge {

/**
 * @class EventSink
 * @brief Downstream consumer of canonical events (response writer boundary).
 *
 * Implementations must not block for long: they run on the connection's
 * own thread between reads.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvents(const CanonicalEvents& events) = 0;
};

class CollectingSink : public EventSink {
public:
    void onEvents(const CanonicalEvents& events) override {
        events_.insert(events_.end(), events.begin(), events.end());
    }
    const CanonicalEvents& events() const { return events_; }

private:
    CanonicalEvents events_;
};

/**
 * Writes SSE records to a stream and flushes after each batch.
 */
class SseStreamSink : public EventSink {
public:
    explicit SseStreamSink(std::ostream& os) : os_(os) {}

    void onEvents(const CanonicalEvents& events) override {
        if (events.empty()) return;
        os_ << toSse(events);
        os_.flush();
    }

private:
    std::ostream& os_;
};

} // namespace StreamBridge
