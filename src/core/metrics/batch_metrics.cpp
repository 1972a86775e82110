#include <batchstore/core/metrics/batch_metrics.hpp>

namespace BatchStore {

void MetricsCollector::record(const FlushEvent& event) {
    auto& cat = categories_[categoryIndex(event.category)];

    total_flushes_.fetch_add(1, std::memory_order_relaxed);
    total_writes_attempted_.fetch_add(event.record_count, std::memory_order_relaxed);
    flushes_by_reason_[static_cast<size_t>(event.reason)].fetch_add(1, std::memory_order_relaxed);
    cat.flushes.fetch_add(1, std::memory_order_relaxed);

    if (event.outcome == FlushOutcome::COMMITTED) {
        total_items_committed_.fetch_add(event.record_count, std::memory_order_relaxed);
        cat.items_committed.fetch_add(event.record_count, std::memory_order_relaxed);
    } else {
        total_failed_flushes_.fetch_add(1, std::memory_order_relaxed);
        cat.failed_flushes.fetch_add(1, std::memory_order_relaxed);
    }

    last_flush_timestamp_ms_.store(event.started_at_ms, std::memory_order_relaxed);

    if (event.record_count == 0) {
        return;
    }

    flush_latency_.record(event.duration_us);

    uint64_t size = event.record_count;
    uint64_t cur_max = max_batch_size_.load(std::memory_order_relaxed);
    while (size > cur_max &&
           !max_batch_size_.compare_exchange_weak(cur_max, size, std::memory_order_relaxed)) {
    }
    uint64_t cur_min = min_batch_size_.load(std::memory_order_relaxed);
    while ((cur_min == 0 || size < cur_min) &&
           !min_batch_size_.compare_exchange_weak(cur_min, size, std::memory_order_relaxed)) {
    }
}

void MetricsCollector::recordEnqueued(Category c) {
    total_enqueued_.fetch_add(1, std::memory_order_relaxed);
    categories_[categoryIndex(c)].enqueued.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::recordRetry(Category) {
    total_retries_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::recordDropped(Category c, size_t count) {
    total_records_dropped_.fetch_add(count, std::memory_order_relaxed);
    categories_[categoryIndex(c)].records_dropped.fetch_add(count, std::memory_order_relaxed);
}

BatchMetricsSnapshot MetricsCollector::snapshot() const {
    BatchMetricsSnapshot snap;
    snap.total_flushes = total_flushes_.load(std::memory_order_relaxed);
    snap.total_writes_attempted = total_writes_attempted_.load(std::memory_order_relaxed);
    snap.total_items_committed = total_items_committed_.load(std::memory_order_relaxed);
    snap.total_failed_flushes = total_failed_flushes_.load(std::memory_order_relaxed);
    snap.total_enqueued = total_enqueued_.load(std::memory_order_relaxed);
    snap.total_retries = total_retries_.load(std::memory_order_relaxed);
    snap.total_records_dropped = total_records_dropped_.load(std::memory_order_relaxed);

    for (size_t i = 0; i < FLUSH_REASON_COUNT; ++i) {
        snap.flushes_by_reason[i] = flushes_by_reason_[i].load(std::memory_order_relaxed);
    }

    snap.min_batch_size = min_batch_size_.load(std::memory_order_relaxed);
    snap.max_batch_size = max_batch_size_.load(std::memory_order_relaxed);
    snap.last_flush_timestamp_ms = last_flush_timestamp_ms_.load(std::memory_order_relaxed);

    snap.flush_p50_us = flush_latency_.percentile(50);
    snap.flush_p99_us = flush_latency_.percentile(99);
    snap.flush_max_us = flush_latency_.maxValue();

    for (size_t i = 0; i < CATEGORY_COUNT; ++i) {
        const auto& src = categories_[i];
        auto& dst = snap.categories[i];
        dst.enqueued = src.enqueued.load(std::memory_order_relaxed);
        dst.flushes = src.flushes.load(std::memory_order_relaxed);
        dst.items_committed = src.items_committed.load(std::memory_order_relaxed);
        dst.failed_flushes = src.failed_flushes.load(std::memory_order_relaxed);
        dst.records_dropped = src.records_dropped.load(std::memory_order_relaxed);
    }
    return snap;
}

} // namespace BatchStore
