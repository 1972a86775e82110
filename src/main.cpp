#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <batchstore/core/config/loader.hpp>
#include <batchstore/core/storage/sqlite_store.hpp>
#include <batchstore/core/storage/batch_executor.hpp>
#include <batchstore/core/writer/persistence_shim.hpp>
#include <batchstore/core/admin/metrics_reporter.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
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

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: shim before executor before store
    std::unique_ptr<BatchStore::SqliteStore> store;
    std::unique_ptr<BatchStore::BatchExecutor> executor;
    std::unique_ptr<BatchStore::PersistenceShim> shim;
    std::unique_ptr<BatchStore::MetricsReporter> reporter;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;
    c.store = std::make_unique<BatchStore::SqliteStore>(config.storage);
    c.executor = std::make_unique<BatchStore::BatchExecutor>(*c.store, config.statements);
    c.shim = std::make_unique<BatchStore::PersistenceShim>(config.batchWriter, *c.executor);
    c.reporter = std::make_unique<BatchStore::MetricsReporter>(
        *c.shim, std::chrono::milliseconds(config.reporting.intervalMs));
    return c;
}

static int stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    if (c.reporter) c.reporter->stop();

    BatchStore::ShutdownReport report;
    if (c.shim) report = c.shim->shutdown();
    if (c.reporter) c.reporter->reportNow();

    spdlog::info("=== SHUTDOWN {} ===", BatchStore::toString(report.status));
    return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[]) {
    spdlog::info("batchstore v1.0.0 starting...");
    setupSignalHandlers();

    int rc = EXIT_SUCCESS;
    try {
        auto config = loadConfiguration(argc, argv);
        setupLogging(config.logging);
        spdlog::info("Configuration loaded successfully");

        auto components = initializeComponents(config);
        components.shim->start();
        components.reporter->start();

        spdlog::info("batchstore running. Press Ctrl+C to shutdown.");

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Shutdown signal received");

        rc = stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("batchstore terminated");
    return rc;
}
