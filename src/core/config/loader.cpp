#include <batchstore/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <stdexcept>

namespace {

template <typename T>
T requireField(const YAML::Node& node, const char* section, const char* key) {
    if (!node[key]) {
        throw std::runtime_error(std::string("Missing required config field: ") + section + "." + key);
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid type for config field ") + section + "." + key
                                 + ": " + e.what());
    }
}

template <typename T>
T optionalField(const YAML::Node& node, const char* section, const char* key, const T& fallback) {
    if (!node || !node[key]) return fallback;
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid type for config field ") + section + "." + key
                                 + ": " + e.what());
    }
}

AppConfig::AppConfiguration parse(const YAML::Node& root) {
    AppConfig::AppConfiguration config;

    config.app_name = optionalField<std::string>(root, "app", "app_name", config.app_name);
    config.version = optionalField<std::string>(root, "app", "version", config.version);

    // batch_writer (required)
    const YAML::Node bw = root["batch_writer"];
    if (!bw) {
        throw std::runtime_error("Missing required config section: batch_writer");
    }
    auto& w = config.batchWriter;
    w.enabled = requireField<bool>(bw, "batch_writer", "enabled");
    long long batch_size = requireField<long long>(bw, "batch_writer", "batch_size");
    long long interval_ms = requireField<long long>(bw, "batch_writer", "flush_interval_ms");
    long long max_buffer = requireField<long long>(bw, "batch_writer", "max_buffer_size");
    if (batch_size <= 0) {
        throw std::runtime_error("batch_writer.batch_size must be > 0");
    }
    if (interval_ms <= 0) {
        throw std::runtime_error("batch_writer.flush_interval_ms must be > 0");
    }
    if (max_buffer <= 0) {
        throw std::runtime_error("batch_writer.max_buffer_size must be > 0");
    }
    w.batchSize = static_cast<size_t>(batch_size);
    w.flushIntervalMs = static_cast<uint64_t>(interval_ms);
    w.maxBufferSize = static_cast<size_t>(max_buffer);
    w.maxRetries = optionalField<uint32_t>(bw, "batch_writer", "max_retries", w.maxRetries);
    w.shutdownTimeoutMs = optionalField<uint64_t>(bw, "batch_writer", "shutdown_timeout_ms", w.shutdownTimeoutMs);
    w.flushWorkers = optionalField<size_t>(bw, "batch_writer", "flush_workers", w.flushWorkers);
    ConfigLoader::validate(w);

    // storage (required path)
    const YAML::Node st = root["storage"];
    if (!st) {
        throw std::runtime_error("Missing required config section: storage");
    }
    auto& s = config.storage;
    s.path = requireField<std::string>(st, "storage", "path");
    s.journalMode = optionalField<std::string>(st, "storage", "journal_mode", s.journalMode);
    s.synchronous = optionalField<std::string>(st, "storage", "synchronous", s.synchronous);
    s.busyTimeoutMs = optionalField<int>(st, "storage", "busy_timeout_ms", s.busyTimeoutMs);
    s.cacheSize = optionalField<int>(st, "storage", "cache_size", s.cacheSize);

    // statements (optional overrides, column count is fixed per category)
    const YAML::Node stmts = root["statements"];
    if (stmts) {
        for (auto c : BatchStore::ALL_CATEGORIES) {
            const char* key = BatchStore::toString(c);
            auto& spec = config.statements[BatchStore::categoryIndex(c)];
            spec.insert_sql = optionalField<std::string>(stmts, "statements", key, spec.insert_sql);
        }
    }

    const YAML::Node lg = root["logging"];
    config.logging.level = optionalField<std::string>(lg, "logging", "level", config.logging.level);
    config.logging.pattern = optionalField<std::string>(lg, "logging", "pattern", config.logging.pattern);
    if (spdlog::level::from_str(config.logging.level) == spdlog::level::off
        && config.logging.level != "off") {
        throw std::runtime_error("Invalid logging.level: " + config.logging.level);
    }

    const YAML::Node rp = root["reporting"];
    config.reporting.intervalMs = optionalField<uint64_t>(rp, "reporting", "interval_ms",
                                                     config.reporting.intervalMs);
    return config;
}

} // namespace

void ConfigLoader::validate(const AppConfig::BatchWriterConfig& config) {
    if (config.batchSize == 0) {
        throw std::runtime_error("batch_writer.batch_size must be > 0");
    }
    if (config.flushIntervalMs == 0) {
        throw std::runtime_error("batch_writer.flush_interval_ms must be > 0");
    }
    if (config.maxBufferSize <= config.batchSize) {
        throw std::runtime_error("batch_writer.max_buffer_size must be greater than batch_size");
    }
    if (config.flushWorkers == 0) {
        throw std::runtime_error("batch_writer.flush_workers must be > 0");
    }
}

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        spdlog::error("Config file not found: {}", filepath);
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config " + filepath + ": " + e.what());
    }
    return parse(root);
}

AppConfig::AppConfiguration ConfigLoader::loadFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
    return parse(root);
}
