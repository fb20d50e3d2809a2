#pragma once
#include <streambridge/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws std::runtime_error on missing file, missing field, wrong type or invalid value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
