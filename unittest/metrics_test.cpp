// ============================================================================
// METRICS UNIT TESTS
// ============================================================================
// Tests for flush statistics, derived values and the latency histogram
// ============================================================================

#include <gtest/gtest.h>
#include <batchstore/core/metrics/batch_metrics.hpp>
#include <batchstore/core/metrics/histogram.hpp>

#include <thread>
#include <vector>

using namespace BatchStore;

namespace {

FlushEvent makeEvent(Category c, FlushReason reason, size_t count,
                     FlushOutcome outcome = FlushOutcome::COMMITTED, uint64_t duration_us = 100) {
    FlushEvent e;
    e.category = c;
    e.reason = reason;
    e.record_count = count;
    e.started_at_ms = 1000 + count;
    e.duration_us = duration_us;
    e.outcome = outcome;
    return e;
}

} // namespace

// ============================================================================
// COLLECTOR TESTS
// ============================================================================

TEST(MetricsCollector, StartsAtZero) {
    MetricsCollector metrics;
    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.total_flushes, 0u);
    EXPECT_EQ(snap.total_items_committed, 0u);
    EXPECT_EQ(snap.min_batch_size, 0u);
    EXPECT_DOUBLE_EQ(snap.avgBatchSize(), 0.0);
    EXPECT_EQ(snap.flush_p99_us, 0u);
}

TEST(MetricsCollector, CountsCommittedFlushes) {
    MetricsCollector metrics;
    metrics.record(makeEvent(Category::MESSAGE, FlushReason::SIZE_THRESHOLD, 100));
    metrics.record(makeEvent(Category::MESSAGE, FlushReason::SIZE_THRESHOLD, 100));
    metrics.record(makeEvent(Category::CONSUMPTION, FlushReason::TIME_INTERVAL, 40));

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.total_flushes, 3u);
    EXPECT_EQ(snap.total_writes_attempted, 240u);
    EXPECT_EQ(snap.total_items_committed, 240u);
    EXPECT_EQ(snap.total_failed_flushes, 0u);
    EXPECT_EQ(snap.flushesBy(FlushReason::SIZE_THRESHOLD), 2u);
    EXPECT_EQ(snap.flushesBy(FlushReason::TIME_INTERVAL), 1u);
    EXPECT_EQ(snap.min_batch_size, 40u);
    EXPECT_EQ(snap.max_batch_size, 100u);
    EXPECT_DOUBLE_EQ(snap.avgBatchSize(), 80.0);
    EXPECT_EQ(snap.last_flush_timestamp_ms, 1040u);

    EXPECT_EQ(snap.category(Category::MESSAGE).items_committed, 200u);
    EXPECT_EQ(snap.category(Category::CONSUMPTION).flushes, 1u);
    EXPECT_EQ(snap.category(Category::SUBSCRIPTION).flushes, 0u);
}

TEST(MetricsCollector, FailedFlushCountsAttemptNotCommit) {
    MetricsCollector metrics;
    metrics.record(makeEvent(Category::CONSUMPTION, FlushReason::TIME_INTERVAL, 50,
                             FlushOutcome::FAILED));

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.total_flushes, 1u);
    EXPECT_EQ(snap.total_writes_attempted, 50u);
    EXPECT_EQ(snap.total_items_committed, 0u);
    EXPECT_EQ(snap.total_failed_flushes, 1u);
    EXPECT_EQ(snap.category(Category::CONSUMPTION).failed_flushes, 1u);
}

TEST(MetricsCollector, EmptyShutdownFlushSkipsBatchSizeStats) {
    MetricsCollector metrics;
    metrics.record(makeEvent(Category::MESSAGE, FlushReason::MANUAL, 10));
    metrics.record(makeEvent(Category::MESSAGE, FlushReason::SHUTDOWN, 0));

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.total_flushes, 2u);
    EXPECT_EQ(snap.flushesBy(FlushReason::SHUTDOWN), 1u);
    EXPECT_EQ(snap.min_batch_size, 10u);
    EXPECT_DOUBLE_EQ(snap.avgBatchSize(), 5.0);
}

TEST(MetricsCollector, EnqueueRetryAndDropCounters) {
    MetricsCollector metrics;
    for (int i = 0; i < 3; ++i) metrics.recordEnqueued(Category::SUBSCRIPTION);
    metrics.recordRetry(Category::SUBSCRIPTION);
    metrics.recordDropped(Category::SUBSCRIPTION, 3);

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.total_enqueued, 3u);
    EXPECT_EQ(snap.category(Category::SUBSCRIPTION).enqueued, 3u);
    EXPECT_EQ(snap.total_retries, 1u);
    EXPECT_EQ(snap.total_records_dropped, 3u);
    EXPECT_EQ(snap.category(Category::SUBSCRIPTION).records_dropped, 3u);
}

TEST(MetricsCollector, ConcurrentRecording) {
    MetricsCollector metrics;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&metrics, t] {
            for (int i = 1; i <= 1000; ++i) {
                metrics.record(makeEvent(ALL_CATEGORIES[t % CATEGORY_COUNT],
                                         FlushReason::SIZE_THRESHOLD, static_cast<size_t>(i)));
            }
        });
    }
    for (auto& t : threads) t.join();

    auto snap = metrics.snapshot();
    EXPECT_EQ(snap.total_flushes, 4000u);
    EXPECT_EQ(snap.total_items_committed, 4u * 500500u);
    EXPECT_EQ(snap.min_batch_size, 1u);
    EXPECT_EQ(snap.max_batch_size, 1000u);
}

// ============================================================================
// HISTOGRAM TESTS
// ============================================================================

TEST(LatencyHistogram, EmptyReturnsZero) {
    LatencyHistogram h;
    EXPECT_EQ(h.totalCount(), 0u);
    EXPECT_EQ(h.percentile(50), 0u);
    EXPECT_EQ(h.maxValue(), 0u);
}

TEST(LatencyHistogram, PercentilesFollowDistribution) {
    LatencyHistogram h;
    for (int i = 0; i < 99; ++i) h.record(100);
    h.record(50000);

    EXPECT_EQ(h.totalCount(), 100u);
    EXPECT_EQ(h.maxValue(), 50000u);
    // 100us sits in [64, 128)
    EXPECT_EQ(h.percentile(50), 127u);
    EXPECT_EQ(h.percentile(99), 127u);
    EXPECT_EQ(h.percentile(100), 50000u);
}

TEST(LatencyHistogram, PercentileNeverExceedsMax) {
    LatencyHistogram h;
    h.record(70);
    EXPECT_EQ(h.percentile(50), 70u);

    h.reset();
    EXPECT_EQ(h.totalCount(), 0u);
    EXPECT_EQ(h.maxValue(), 0u);
}
