// ============================================================================
// BATCHSTORE - WRITE COALESCING BENCHMARK
// ============================================================================
// Compares one-transaction-per-record writes with coalesced batches
// against an on-disk SQLite database (WAL, synchronous=NORMAL)
//
// Scenarios:
// 1. Direct writes (batching disabled)
// 2. Batched writes, single producer
// 3. Batched writes, concurrent producers across all categories
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <iomanip>
#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>
#include <batchstore/core/storage/sqlite_store.hpp>
#include <batchstore/core/storage/batch_executor.hpp>
#include <batchstore/core/writer/persistence_shim.hpp>

using namespace std::chrono;
using namespace BatchStore;

namespace fs = std::filesystem;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkMetrics {
    std::string name;
    uint64_t operations;
    double throughput_ops_sec;
    double duration_sec;
    double avg_batch_size;
    uint64_t p99_commit_us;
};

std::vector<BenchmarkMetrics> g_results;

static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS messages (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    topic TEXT, message_id TEXT, message TEXT, producer TEXT, timestamp REAL);
CREATE TABLE IF NOT EXISTS consumptions (
    consumer TEXT, topic TEXT, message_id TEXT, message TEXT, timestamp REAL);
CREATE TABLE IF NOT EXISTS subscriptions (
    sid TEXT, consumer TEXT, topic TEXT, connected_at REAL, PRIMARY KEY (sid, topic));
)SQL";

struct TempDatabase {
    fs::path path;

    explicit TempDatabase(const std::string& name)
        : path(fs::temp_directory_path() / ("batchstore_bench_" + name + ".db")) {
        cleanup();
    }
    ~TempDatabase() { cleanup(); }

    void cleanup() {
        std::error_code ec;
        fs::remove(path, ec);
        fs::remove(path.string() + "-wal", ec);
        fs::remove(path.string() + "-shm", ec);
    }

    AppConfig::StorageConfig config() const {
        AppConfig::StorageConfig c;
        c.path = path.string();
        return c;
    }
};

BenchmarkMetrics runScenario(const std::string& name, bool batching,
                             size_t producers, uint64_t records_per_producer) {
    TempDatabase db(name);
    SqliteStore store(db.config());
    store.execute(kSchema);
    BatchExecutor executor(store);

    AppConfig::BatchWriterConfig config;
    config.enabled = batching;
    PersistenceShim shim(config, executor);
    shim.start();

    auto start = steady_clock::now();

    std::vector<std::thread> threads;
    for (size_t p = 0; p < producers; ++p) {
        threads.emplace_back([&shim, p, records_per_producer]() {
            const std::string producer = "producer-" + std::to_string(p);
            for (uint64_t i = 0; i < records_per_producer; ++i) {
                const std::string id = producer + "-" + std::to_string(i);
                const double ts = static_cast<double>(i);
                switch (i % 3) {
                    case 0: shim.recordMessage("bench", id, "payload", producer, ts); break;
                    case 1: shim.recordConsumption(producer, "bench", id, "payload", ts); break;
                    default: shim.recordSubscription(id, producer, "bench", ts); break;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    ShutdownReport report = shim.shutdown();

    double duration = duration_cast<microseconds>(steady_clock::now() - start).count() / 1e6;
    MetricsReport metrics = shim.metricsReport();

    BenchmarkMetrics m;
    m.name = name;
    m.operations = producers * records_per_producer;
    m.duration_sec = duration;
    m.throughput_ops_sec = duration > 0 ? m.operations / duration : 0;
    m.avg_batch_size = batching ? metrics.metrics.avgBatchSize() : 1.0;
    m.p99_commit_us = metrics.metrics.flush_p99_us;

    std::cout << "  Records:    " << m.operations << std::endl;
    std::cout << "  Duration:   " << std::fixed << std::setprecision(3) << duration << " s" << std::endl;
    std::cout << "  Throughput: " << std::setprecision(0) << m.throughput_ops_sec << " records/sec" << std::endl;
    if (batching) {
        std::cout << "  Avg batch:  " << std::setprecision(1) << m.avg_batch_size << std::endl;
        std::cout << "  Commit p99: " << m.p99_commit_us << " us" << std::endl;
        std::cout << "  Shutdown:   " << toString(report.status) << std::endl;
    }
    return m;
}

void print_summary() {
    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << "                     BATCHSTORE BENCHMARK SUMMARY" << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    std::cout << std::left << std::setw(34) << "Scenario"
              << std::right << std::setw(16) << "Records/sec"
              << std::setw(14) << "Avg batch"
              << std::setw(16) << "p99 commit" << std::endl;
    std::cout << std::string(80, '-') << std::endl;

    for (const auto& r : g_results) {
        std::cout << std::left << std::setw(34) << r.name
                  << std::right << std::setw(16) << std::fixed << std::setprecision(0) << r.throughput_ops_sec
                  << std::setw(14) << std::setprecision(1) << r.avg_batch_size
                  << std::setw(13) << r.p99_commit_us << " us" << std::endl;
    }

    if (g_results.size() >= 2 && g_results[0].throughput_ops_sec > 0) {
        std::cout << std::string(80, '-') << std::endl;
        std::cout << "Batched speedup: " << std::setprecision(1)
                  << g_results[1].throughput_ops_sec / g_results[0].throughput_ops_sec << "x" << std::endl;
    }
    std::cout << std::string(80, '=') << std::endl;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "\n[1] Direct writes (one transaction per record)" << std::endl;
    std::cout << std::string(50, '-') << std::endl;
    g_results.push_back(runScenario("direct", false, 1, 3000));

    std::cout << "\n[2] Batched writes (1 producer)" << std::endl;
    std::cout << std::string(50, '-') << std::endl;
    g_results.push_back(runScenario("batched_single", true, 1, 60000));

    std::cout << "\n[3] Batched writes (4 producers)" << std::endl;
    std::cout << std::string(50, '-') << std::endl;
    g_results.push_back(runScenario("batched_multi", true, 4, 30000));

    print_summary();
    return 0;
}
