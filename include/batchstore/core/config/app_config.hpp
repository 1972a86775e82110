#pragma once

#include <batchstore/core/records/category.hpp>
#include <cstdint>
#include <string>

namespace AppConfig {

/**
 * @brief Write-coalescing settings, immutable for one running instance.
 * Invariants (checked by ConfigLoader::validate):
 *   batchSize > 0, flushIntervalMs > 0, maxBufferSize > batchSize
 */
struct BatchWriterConfig {
    bool enabled = true;
    size_t batchSize = 100;
    uint64_t flushIntervalMs = 50;
    size_t maxBufferSize = 10000;
    uint32_t maxRetries = 3;            // Failed batch is dropped after this many retries
    uint64_t shutdownTimeoutMs = 5000;
    size_t flushWorkers = BatchStore::CATEGORY_COUNT;
};

struct StorageConfig {
    std::string path = "batchstore.db";
    std::string journalMode = "WAL";
    std::string synchronous = "NORMAL";
    int busyTimeoutMs = 5000;
    int cacheSize = -64000;             // Negative = KiB (SQLite convention)
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct ReportingConfig {
    uint64_t intervalMs = 10000;        // 0 disables the periodic report
};

struct AppConfiguration {
    std::string app_name = "batchstore";
    std::string version = "1.0.0";
    BatchWriterConfig batchWriter;
    StorageConfig storage;
    BatchStore::CategorySpecs statements = BatchStore::defaultCategorySpecs();
    LoggingConfig logging;
    ReportingConfig reporting;
};

} // namespace AppConfig
