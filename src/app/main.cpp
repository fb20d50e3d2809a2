#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <unistd.h>

#include <streambridge/core/config/loader.hpp>
#include <streambridge/core/pipeline/event_sink.hpp>
#include <streambridge/core/pipeline/fd_pump.hpp>
#include <streambridge/core/pipeline/stream_pipeline.hpp>

// ============================================================================
// Replay tool: binary event-stream capture in, Claude SSE out
// ============================================================================
// Usage: streambridge_replay [config.yaml] [capture.bin | -]
// SSE goes to stdout, logs to stderr.
// ============================================================================

static std::atomic<StreamBridge::FdStreamPump*> g_pump{nullptr};

static void signalHandler(int) {
    if (auto* pump = g_pump.load(std::memory_order_acquire)) {
        pump->stop();
    }
}

static void setupLogging() {
    spdlog::set_default_logger(spdlog::stderr_color_mt("streambridge"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("StreamBridge replay v1.0.0 starting...");
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

static int openInput(int argc, char* argv[], std::string& name) {
    if (argc < 3 || std::strcmp(argv[2], "-") == 0) {
        name = "stdin";
        return STDIN_FILENO;
    }
    name = argv[2];
    int fd = ::open(argv[2], O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error("Cannot open capture " + name + ": " + std::strerror(errno));
    }
    return fd;
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::info("Configuration loaded: {} v{}", config.app_name, config.version);

        StreamBridge::TranslatorOptions options;
        options.model = config.translator.model;
        options.input_tokens = config.translator.inputTokens;
        options.allow_missing_start = config.translator.allowMissingStart;

        StreamBridge::StreamPipeline pipeline(options, config.decoder.maxFrameBytes);
        StreamBridge::SseStreamSink sink(std::cout);

        std::string inputName;
        int fd = openInput(argc, argv, inputName);

        StreamBridge::FdStreamPump pump(pipeline, sink, config.replay.chunkSize, inputName);
        g_pump.store(&pump, std::memory_order_release);
        bool finished = pump.run(fd);
        g_pump.store(nullptr, std::memory_order_release);

        if (fd != STDIN_FILENO) {
            ::close(fd);
        }

        if (!finished) {
            spdlog::warn("Replay interrupted before the stream terminated");
            return EXIT_FAILURE;
        }

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("StreamBridge replay terminated gracefully");
    return EXIT_SUCCESS;
}
