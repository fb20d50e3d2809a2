// ============================================================================
// BENCHMARK: FRAME DECODER + TRANSLATOR THROUGHPUT
// ============================================================================
// Scenarios:
// 1. Whole capture fed in one chunk
// 2. Network-sized chunks (1460 bytes, one TCP segment)
// 3. Pathological 1-byte chunks
// ============================================================================

#include <iostream>
#include <chrono>
#include <vector>
#include <string>
#include <iomanip>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <streambridge/core/frame/frame_encoder.hpp>
#include <streambridge/core/pipeline/stream_pipeline.hpp>

using namespace StreamBridge;

namespace {

std::vector<uint8_t> buildCapture(size_t fragments) {
    std::vector<uint8_t> bytes = encodeEventFrame("initial-response", "{\"conversationId\":\"bench\"}");
    for (size_t i = 0; i < fragments; ++i) {
        auto frame = encodeEventFrame("assistantResponseEvent",
                                      "{\"content\":\"token " + std::to_string(i) + " of the answer \"}");
        bytes.insert(bytes.end(), frame.begin(), frame.end());
    }
    return bytes;
}

void runScenario(const char* name, const std::vector<uint8_t>& capture, size_t chunk, int iterations) {
    uint64_t events = 0;
    auto start = std::chrono::steady_clock::now();

    for (int it = 0; it < iterations; ++it) {
        StreamPipeline pipeline;
        for (size_t off = 0; off < capture.size(); off += chunk) {
            events += pipeline.onBytes(capture.data() + off, std::min(chunk, capture.size() - off)).size();
        }
        events += pipeline.onEof().size();
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    double mb = static_cast<double>(capture.size()) * iterations / (1024.0 * 1024.0);

    std::cout << std::left << std::setw(24) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(1) << mb / elapsed << " MB/s"
              << std::setw(14) << static_cast<uint64_t>(events / elapsed) << " events/s"
              << std::endl;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    auto capture = buildCapture(10000);
    std::cout << "Capture: " << capture.size() << " bytes, 10001 frames" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    runScenario("whole buffer", capture, capture.size(), 20);
    runScenario("1460-byte chunks", capture, 1460, 20);
    runScenario("1-byte chunks", capture, 1, 2);

    return 0;
}
