#include <streambridge/core/config/loader.hpp>
#include <streambridge/core/errors.hpp>
#include <streambridge/core/frame/frame.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <array>
#include <algorithm>

using StreamBridge::ConfigError;

namespace {

YAML::Node requireNode(const YAML::Node& parent, const char* key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull())
        throw ConfigError("Missing required config field: " + path);
    return node;
}

template <typename T>
T readScalar(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar())
        throw ConfigError("Config field " + path + " must be a scalar");
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw ConfigError("Config field " + path + " has invalid type: " + e.what());
    }
}

template <typename T>
T readOptional(const YAML::Node& parent, const char* key, const std::string& path, T fallback) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull())
        return fallback;
    return readScalar<T>(node, path);
}

int64_t readRange(const YAML::Node& parent, const char* key, const std::string& path,
                  int64_t fallback, int64_t minValue, int64_t maxValue) {
    int64_t v = readOptional<int64_t>(parent, key, path, fallback);
    if (v < minValue || v > maxValue)
        throw ConfigError("Config field " + path + " out of range [" + std::to_string(minValue) +
                          ", " + std::to_string(maxValue) + "]: " + std::to_string(v));
    return v;
}

void validateLogLevel(const std::string& level) {
    static const std::array<const char*, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    bool known = std::any_of(kLevels.begin(), kLevels.end(),
                             [&level](const char* l) { return level == l; });
    if (!known)
        throw ConfigError("Config field logging.level has unknown level: " + level);
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot open config file: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw ConfigError("Malformed YAML in " + filepath + ": " + e.what());
    }

    if (!root.IsMap())
        throw ConfigError("Config root must be a mapping: " + filepath);

    AppConfig::AppConfiguration config;
    config.app_name = readScalar<std::string>(requireNode(root, "app_name", "app_name"), "app_name");
    config.version = readScalar<std::string>(requireNode(root, "version", "version"), "version");

    if (YAML::Node logging = root["logging"]) {
        config.logging.level = readOptional<std::string>(logging, "level", "logging.level",
                                                         config.logging.level);
    }
    validateLogLevel(config.logging.level);

    YAML::Node decoder = requireNode(root, "decoder", "decoder");
    config.decoder.maxFrameBytes = static_cast<uint32_t>(
        readRange(decoder, "max_frame_bytes", "decoder.max_frame_bytes",
                  config.decoder.maxFrameBytes,
                  static_cast<int64_t>(StreamBridge::MIN_FRAME_LENGTH), UINT32_MAX));

    YAML::Node translator = requireNode(root, "translator", "translator");
    config.translator.model = readScalar<std::string>(
        requireNode(translator, "model", "translator.model"), "translator.model");
    if (config.translator.model.empty())
        throw ConfigError("Config field translator.model cannot be empty");
    config.translator.allowMissingStart = readOptional<bool>(
        translator, "allow_missing_start", "translator.allow_missing_start", false);
    config.translator.inputTokens = static_cast<uint32_t>(
        readRange(translator, "input_tokens", "translator.input_tokens", 0, 0, UINT32_MAX));

    if (YAML::Node replay = root["replay"]) {
        config.replay.chunkSize = static_cast<size_t>(
            readRange(replay, "chunk_size", "replay.chunk_size",
                      static_cast<int64_t>(config.replay.chunkSize), 1, 16 * 1024 * 1024));
    }

    spdlog::debug("[ConfigLoader] Loaded {} v{} from {}", config.app_name, config.version, filepath);
    return config;
}
