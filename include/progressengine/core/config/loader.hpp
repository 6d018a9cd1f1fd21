#pragma once
#include <progressengine/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /// Throws std::runtime_error on a missing file, field, wrong type or bad value.
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
