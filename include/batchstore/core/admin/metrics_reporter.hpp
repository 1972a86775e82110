#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <batchstore/core/writer/persistence_shim.hpp>

namespace BatchStore {

/**
 * @class MetricsReporter
 * @brief Periodically logs a health table built from the shim's MetricsReport.
 */
class MetricsReporter {
public:
    MetricsReporter(const PersistenceShim& shim, std::chrono::milliseconds interval);
    ~MetricsReporter() noexcept;

    void start();
    void stop();

    /**
     * @brief Log one report immediately (also used at shutdown)
     */
    void reportNow() const;

    uint64_t reportsEmitted() const { return reports_.load(std::memory_order_relaxed); }

private:
    void loop();

    const PersistenceShim& shim_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread worker_thread_;
    mutable std::atomic<uint64_t> reports_{0};

    // For interruptible sleep during shutdown
    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace BatchStore
