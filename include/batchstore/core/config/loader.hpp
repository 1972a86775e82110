#pragma once
#include <batchstore/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml);

    // Throws std::runtime_error describing the first violated constraint
    static void validate(const AppConfig::BatchWriterConfig& config);
};
