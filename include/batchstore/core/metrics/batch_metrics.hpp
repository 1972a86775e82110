#pragma once

#include <batchstore/core/flush/flush_policy.hpp>
#include <batchstore/core/metrics/histogram.hpp>
#include <batchstore/core/records/category.hpp>
#include <batchstore/core/storage/batch_executor.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace BatchStore {

/**
 * @brief One flush attempt, produced once and never mutated
 */
struct FlushEvent {
    Category category = Category::MESSAGE;
    FlushReason reason = FlushReason::TIME_INTERVAL;
    size_t record_count = 0;
    uint64_t started_at_ms = 0;     // Wall clock
    uint64_t duration_us = 0;
    FlushOutcome outcome = FlushOutcome::COMMITTED;

    double durationMs() const { return static_cast<double>(duration_us) / 1000.0; }
};

struct CategoryCountersSnapshot {
    uint64_t enqueued = 0;
    uint64_t flushes = 0;
    uint64_t items_committed = 0;
    uint64_t failed_flushes = 0;
    uint64_t records_dropped = 0;
};

/**
 * Non-atomic snapshot for consistent reads (reporting, tests)
 */
struct BatchMetricsSnapshot {
    uint64_t total_flushes = 0;
    uint64_t total_writes_attempted = 0;
    uint64_t total_items_committed = 0;
    uint64_t total_failed_flushes = 0;
    uint64_t total_enqueued = 0;
    uint64_t total_retries = 0;
    uint64_t total_records_dropped = 0;

    std::array<uint64_t, FLUSH_REASON_COUNT> flushes_by_reason{};

    uint64_t min_batch_size = 0;    // 0 until the first non-empty flush
    uint64_t max_batch_size = 0;
    uint64_t last_flush_timestamp_ms = 0;

    uint64_t flush_p50_us = 0;
    uint64_t flush_p99_us = 0;
    uint64_t flush_max_us = 0;

    std::array<CategoryCountersSnapshot, CATEGORY_COUNT> categories{};

    uint64_t flushesBy(FlushReason r) const {
        return flushes_by_reason[static_cast<size_t>(r)];
    }

    const CategoryCountersSnapshot& category(Category c) const {
        return categories[categoryIndex(c)];
    }

    double avgBatchSize() const {
        return total_flushes > 0
            ? static_cast<double>(total_items_committed) / static_cast<double>(total_flushes)
            : 0.0;
    }
};

/**
 * @class MetricsCollector
 * @brief Cumulative flush statistics, updated only by the flush path.
 *
 * All counters are relaxed atomics. Zero-size flushes (shutdown no-ops)
 * count toward total_flushes but not toward min/max batch size.
 */
class MetricsCollector {
public:
    MetricsCollector() = default;

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void record(const FlushEvent& event);

    void recordEnqueued(Category c);
    void recordRetry(Category c);
    void recordDropped(Category c, size_t count);

    BatchMetricsSnapshot snapshot() const;

private:
    struct CategoryCounters {
        std::atomic<uint64_t> enqueued{0};
        std::atomic<uint64_t> flushes{0};
        std::atomic<uint64_t> items_committed{0};
        std::atomic<uint64_t> failed_flushes{0};
        std::atomic<uint64_t> records_dropped{0};
    };

    std::atomic<uint64_t> total_flushes_{0};
    std::atomic<uint64_t> total_writes_attempted_{0};
    std::atomic<uint64_t> total_items_committed_{0};
    std::atomic<uint64_t> total_failed_flushes_{0};
    std::atomic<uint64_t> total_enqueued_{0};
    std::atomic<uint64_t> total_retries_{0};
    std::atomic<uint64_t> total_records_dropped_{0};

    std::array<std::atomic<uint64_t>, FLUSH_REASON_COUNT> flushes_by_reason_{};

    std::atomic<uint64_t> min_batch_size_{0};
    std::atomic<uint64_t> max_batch_size_{0};
    std::atomic<uint64_t> last_flush_timestamp_ms_{0};

    std::array<CategoryCounters, CATEGORY_COUNT> categories_{};

    LatencyHistogram flush_latency_;
};

} // namespace BatchStore
