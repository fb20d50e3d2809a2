// ============================================================================
// STREAM PIPELINE UNIT TESTS
// ============================================================================
// Bytes in, canonical events out:
// - end-to-end ordering for the reference conversation
// - chunking independence
// - corruption / truncation surfaced as a single terminal error
// ============================================================================

#include <gtest/gtest.h>
#include <streambridge/core/pipeline/stream_pipeline.hpp>
#include <streambridge/core/pipeline/event_sink.hpp>
#include <streambridge/core/frame/frame_encoder.hpp>
#include "test_frames.hpp"
#include <algorithm>
#include <sstream>
#include <thread>

using namespace StreamBridge;
using TestFrames::names;

namespace {

using Names = std::vector<std::string>;

std::vector<uint8_t> referenceConversation() {
    return TestFrames::concat({
        TestFrames::initialResponse("abc"),
        TestFrames::assistantText("Hi"),
    });
}

CanonicalEvents feedInChunks(StreamPipeline& p, const std::vector<uint8_t>& bytes, size_t chunk) {
    CanonicalEvents out;
    for (size_t off = 0; off < bytes.size(); off += chunk) {
        auto batch = p.onBytes(bytes.data() + off, std::min(chunk, bytes.size() - off));
        out.insert(out.end(), batch.begin(), batch.end());
    }
    auto tail = p.onEof();
    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

} // namespace

// ============================================================================
// END-TO-END
// ============================================================================

TEST(StreamPipeline, ReferenceConversation) {
    StreamPipeline pipeline;
    auto events = pipeline.onBytes(referenceConversation());
    EXPECT_EQ(names(events), (Names{"stream-start", "block-start", "content-delta"}));

    auto tail = pipeline.onEof();
    EXPECT_EQ(names(tail), (Names{"block-stop", "stream-stop"}));

    EXPECT_EQ(std::get<StreamStart>(events[0]).conversation_id, "abc");
    EXPECT_EQ(std::get<BlockStart>(events[1]).index, 0);
    EXPECT_EQ(std::get<ContentDelta>(events[2]).text, "Hi");
    EXPECT_TRUE(pipeline.terminated());
}

TEST(StreamPipeline, OversizedDeclaredLengthWaitsForMoreBytes) {
    auto first = TestFrames::initialResponse("abc");
    StreamPipeline pipeline;

    EXPECT_TRUE(pipeline.onBytes(first.data(), first.size() - 3).empty());
    EXPECT_EQ(pipeline.decoder().buffered(), first.size() - 3);

    auto events = pipeline.onBytes(first.data() + first.size() - 3, 3);
    EXPECT_EQ(names(events), (Names{"stream-start"}));
    EXPECT_EQ(pipeline.decoder().buffered(), 0u);
}

TEST(StreamPipeline, ChunkingDoesNotChangeEvents) {
    auto bytes = TestFrames::concat({
        TestFrames::initialResponse("abc"),
        TestFrames::assistantText("Hello"),
        encodeEventFrame("meteringEvent", "{\"usage\":3}"),
        TestFrames::assistantText(" world"),
        encodeEventFrame("toolUseEvent", "{\"toolUseId\":\"t1\",\"name\":\"ls\",\"input\":\"{}\",\"stop\":true}"),
        encodeEventFrame("assistantResponseEnd", "{}"),
    });

    StreamPipeline reference;
    auto expected = names(feedInChunks(reference, bytes, bytes.size()));
    EXPECT_EQ(expected, (Names{"stream-start", "block-start", "content-delta", "content-delta",
                               "block-stop", "block-start", "input-json-delta", "block-stop",
                               "stream-stop"}));

    for (size_t chunk : {size_t{1}, size_t{2}, size_t{3}, size_t{7}, size_t{12}, size_t{13}, size_t{64}}) {
        StreamPipeline pipeline;
        EXPECT_EQ(names(feedInChunks(pipeline, bytes, chunk)), expected) << "chunk " << chunk;
    }
}

TEST(StreamPipeline, Stats) {
    auto bytes = TestFrames::concat({
        TestFrames::initialResponse("abc"),
        encodeEventFrame("meteringEvent", "{}"),
        TestFrames::assistantText("Hi"),
    });
    StreamPipeline pipeline;
    pipeline.onBytes(bytes);
    pipeline.onEof();

    auto stats = pipeline.stats();
    EXPECT_EQ(stats.bytes_fed, bytes.size());
    EXPECT_EQ(stats.frames_decoded, 3u);
    EXPECT_EQ(stats.events_emitted, 5u);
    EXPECT_EQ(stats.unrecognized_events, 1u);
}

// ============================================================================
// FAILURE PATHS
// ============================================================================

TEST(StreamPipeline, CorruptFrameTerminatesWithSingleError) {
    auto good = TestFrames::initialResponse("abc");
    auto bad = TestFrames::assistantText("Hi");
    bad[bad.size() - 6] ^= 0x20;  // payload byte

    StreamPipeline pipeline;
    auto events = pipeline.onBytes(TestFrames::concat({good, bad}));
    EXPECT_EQ(names(events), (Names{"stream-start", "error"}));
    EXPECT_EQ(std::get<StreamError>(events.back()).kind, ErrorKind::FRAME_CORRUPTION);
    EXPECT_TRUE(pipeline.terminated());

    EXPECT_TRUE(pipeline.onBytes(TestFrames::assistantText("more")).empty());
    EXPECT_TRUE(pipeline.onEof().empty());
}

TEST(StreamPipeline, TruncatedFrameAtEofIsCorruption) {
    auto bytes = referenceConversation();
    StreamPipeline pipeline;
    auto events = pipeline.onBytes(bytes.data(), bytes.size() - 4);
    EXPECT_EQ(names(events), (Names{"stream-start"}));

    auto tail = pipeline.onEof();
    ASSERT_EQ(tail.size(), 1u);
    EXPECT_EQ(std::get<StreamError>(tail[0]).kind, ErrorKind::FRAME_CORRUPTION);
}

TEST(StreamPipeline, MalformedPayloadIsProtocolViolation) {
    StreamPipeline pipeline;
    auto events = pipeline.onBytes(TestFrames::concat({
        TestFrames::initialResponse("abc"),
        encodeEventFrame("assistantResponseEvent", "{\"content\":"),
        TestFrames::assistantText("never seen"),
    }));
    EXPECT_EQ(names(events), (Names{"stream-start", "error"}));
    EXPECT_EQ(std::get<StreamError>(events.back()).kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(StreamPipeline, ContentBeforeStartFailsFast) {
    StreamPipeline pipeline;
    auto events = pipeline.onBytes(TestFrames::assistantText("Hi"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<StreamError>(events[0]).kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(StreamPipeline, VendorErrorFrame) {
    HeaderList errorHeaders = {
        {":message-type", HeaderValue::fromString("exception")},
        {":exception-type", HeaderValue::fromString("ValidationException")},
    };
    StreamPipeline pipeline;
    auto events = pipeline.onBytes(TestFrames::concat({
        TestFrames::initialResponse("abc"),
        TestFrames::assistantText("Hi"),
        encodeFrame(errorHeaders, std::string("{\"message\":\"bad input\"}")),
    }));
    EXPECT_EQ(names(events), (Names{"stream-start", "block-start", "content-delta", "error"}));
    EXPECT_EQ(std::get<StreamError>(events.back()).message, "ValidationException: bad input");
    EXPECT_TRUE(pipeline.onEof().empty());
}

TEST(StreamPipeline, NonUtf8ExceptionPayloadStillWritesErrorRecord) {
    HeaderList exceptionHeaders = {
        {":message-type", HeaderValue::fromString("exception")},
    };
    std::ostringstream os;
    SseStreamSink sink(os);
    StreamPipeline pipeline;

    ASSERT_NO_THROW({
        sink.onEvents(pipeline.onBytes(TestFrames::concat({
            TestFrames::initialResponse("abc"),
            encodeFrame(exceptionHeaders, std::string("\xff\xfe")),
        })));
        sink.onEvents(pipeline.onEof());
    });

    std::string sse = os.str();
    size_t first = sse.find("event: error\n");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(sse.find("event: error\n", first + 1), std::string::npos);
    EXPECT_EQ(sse.find("event: message_stop\n"), std::string::npos);
    EXPECT_TRUE(pipeline.terminated());
}

TEST(StreamPipeline, FramesAfterResponseEndAreIgnored) {
    StreamPipeline pipeline;
    auto events = pipeline.onBytes(TestFrames::concat({
        TestFrames::initialResponse("abc"),
        encodeEventFrame("assistantResponseEnd", "{}"),
        TestFrames::assistantText("late"),
    }));
    EXPECT_EQ(names(events), (Names{"stream-start", "stream-stop"}));
    EXPECT_TRUE(pipeline.onEof().empty());
}

TEST(StreamPipeline, FrameLimitFromOptions) {
    StreamPipeline pipeline({}, 32);
    auto events = pipeline.onBytes(TestFrames::initialResponse("abc"));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<StreamError>(events[0]).kind, ErrorKind::FRAME_CORRUPTION);
}

TEST(StreamPipeline, TransportErrorIsTerminal) {
    StreamPipeline pipeline;
    pipeline.onBytes(TestFrames::initialResponse("abc"));
    auto events = pipeline.onTransportError("connection reset");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<StreamError>(events[0]).kind, ErrorKind::TRANSPORT);
    EXPECT_TRUE(pipeline.onEof().empty());
}

// ============================================================================
// SYNCHRONIZED WRAPPER
// ============================================================================

TEST(SynchronizedPipeline, SerializesProducers) {
    auto bytes = referenceConversation();
    SynchronizedPipeline pipeline;

    std::mutex outMutex;
    CanonicalEvents events;
    std::thread producer([&]() {
        for (uint8_t b : bytes) {
            auto batch = pipeline.onBytes(&b, 1);
            std::lock_guard<std::mutex> lock(outMutex);
            events.insert(events.end(), batch.begin(), batch.end());
        }
    });
    producer.join();

    auto tail = pipeline.onEof();
    events.insert(events.end(), tail.begin(), tail.end());
    EXPECT_EQ(names(events), (Names{"stream-start", "block-start", "content-delta",
                                    "block-stop", "stream-stop"}));
    EXPECT_TRUE(pipeline.terminated());
    EXPECT_EQ(pipeline.stats().frames_decoded, 2u);
}

TEST(SynchronizedPipeline, ForwardsTransportError) {
    SynchronizedPipeline pipeline;
    auto first = TestFrames::initialResponse("abc");
    auto started = pipeline.onBytes(first.data(), first.size());
    EXPECT_EQ(names(started), (Names{"stream-start"}));

    auto events = pipeline.onTransportError("connection reset");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<StreamError>(events[0]).kind, ErrorKind::TRANSPORT);
    EXPECT_TRUE(pipeline.terminated());
    EXPECT_TRUE(pipeline.onEof().empty());
}
