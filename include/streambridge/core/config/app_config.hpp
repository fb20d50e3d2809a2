#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
};

struct DecoderConfig {
    uint32_t maxFrameBytes = 16 * 1024 * 1024;
};

struct TranslatorConfig {
    std::string model = "claude-sonnet-4.5";
    bool allowMissingStart = false;
    uint32_t inputTokens = 0;
};

struct ReplayConfig {
    size_t chunkSize = 4096;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    DecoderConfig decoder;
    TranslatorConfig translator;
    ReplayConfig replay;
};

} // namespace AppConfig
