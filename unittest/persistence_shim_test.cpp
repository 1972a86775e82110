// ============================================================================
// PERSISTENCE SHIM UNIT TESTS
// ============================================================================
// Broker-facing entry points with batching on and off, plus reporting
// ============================================================================

#include <gtest/gtest.h>
#include <batchstore/core/writer/persistence_shim.hpp>
#include <batchstore/core/admin/metrics_reporter.hpp>
#include <batchstore/core/errors.hpp>
#include "test_support.hpp"

using namespace BatchStore;
using namespace BatchStoreTest;

class PersistenceShimTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<SqliteStore>(memoryStorage());
        store->execute(kSchema);
        executor = std::make_unique<BatchExecutor>(*store);
    }

    void TearDown() override {
        shim.reset();
        executor.reset();
        store.reset();
    }

    PersistenceShim& makeShim(bool enabled) {
        auto config = writerConfig(100, 10000, 10000);
        config.enabled = enabled;
        shim = std::make_unique<PersistenceShim>(config, *executor);
        return *shim;
    }

    std::unique_ptr<SqliteStore> store;
    std::unique_ptr<BatchExecutor> executor;
    std::unique_ptr<PersistenceShim> shim;
};

// ============================================================================
// BATCHING ENABLED
// ============================================================================

TEST_F(PersistenceShimTest, RecordsAreBufferedUntilFlush) {
    PersistenceShim& s = makeShim(true);
    ASSERT_TRUE(s.batchingEnabled());
    s.start();

    s.recordMessage("orders", "m-1", "hello", "producer-1", 1.5);
    s.recordConsumption("consumer-1", "orders", "m-1", "hello", 2.5);
    s.recordSubscription("sid-1", "consumer-1", "orders", 3.5);

    EXPECT_EQ(countRows(*store, "messages"), 0);
    auto report = s.metricsReport();
    EXPECT_TRUE(report.enabled);
    EXPECT_EQ(report.bufferSize(Category::MESSAGE), 1u);
    EXPECT_EQ(report.metrics.total_enqueued, 3u);

    EXPECT_TRUE(s.flushAll());
    EXPECT_EQ(countRows(*store, "messages"), 1);
    EXPECT_EQ(countRows(*store, "consumptions"), 1);
    EXPECT_EQ(countRows(*store, "subscriptions"), 1);
    EXPECT_EQ(s.metricsReport().metrics.flushesBy(FlushReason::MANUAL), 3u);
}

TEST_F(PersistenceShimTest, ArityCheckedBeforeBuffering) {
    PersistenceShim& s = makeShim(true);

    EXPECT_THROW(s.recordMessage({std::string("orders"), std::string("m-1")}), RecordArityError);
    EXPECT_THROW(s.recordSubscription({std::string("a"), std::string("b"), std::string("c"),
                                       1.0, 2.0}), RecordArityError);
    EXPECT_EQ(s.metricsReport().bufferSize(Category::MESSAGE), 0u);
    EXPECT_EQ(s.metricsReport().metrics.total_enqueued, 0u);
}

TEST_F(PersistenceShimTest, ShutdownMakesEverythingDurable) {
    PersistenceShim& s = makeShim(true);
    s.start();
    for (int i = 0; i < 25; ++i) {
        s.recordMessage("orders", "m-" + std::to_string(i), "body", "p", static_cast<double>(i));
    }

    ShutdownReport report = s.shutdown();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(countRows(*store, "messages"), 25);
    EXPECT_THROW(s.recordMessage("orders", "late", "body", "p", 99.0), EnqueueRejected);
}

// ============================================================================
// BATCHING DISABLED
// ============================================================================

TEST_F(PersistenceShimTest, DisabledWritesImmediately) {
    PersistenceShim& s = makeShim(false);
    EXPECT_FALSE(s.batchingEnabled());
    EXPECT_EQ(s.writer(), nullptr);
    s.start();

    s.recordMessage("orders", "m-1", "hello", "producer-1", 1.0);
    EXPECT_EQ(countRows(*store, "messages"), 1);

    EXPECT_TRUE(s.flushAll());
    EXPECT_TRUE(s.shutdown().ok());
    EXPECT_FALSE(s.metricsReport().enabled);
}

TEST_F(PersistenceShimTest, DisabledSurfacesStoreErrors) {
    PersistenceShim& s = makeShim(false);
    failInserts(*store, "consumptions");

    EXPECT_THROW(s.recordConsumption("c", "orders", "m-1", "hello", 1.0), StoreError);
    EXPECT_EQ(countRows(*store, "consumptions"), 0);
}

// ============================================================================
// REPORTER TESTS
// ============================================================================

TEST_F(PersistenceShimTest, ReporterEmitsPeriodically) {
    PersistenceShim& s = makeShim(true);
    MetricsReporter reporter(s, std::chrono::milliseconds(10));
    reporter.start();

    s.recordMessage("orders", "m-1", "hello", "producer-1", 1.0);
    EXPECT_TRUE(waitFor([&] { return reporter.reportsEmitted() >= 2; }));
    reporter.stop();

    const uint64_t emitted = reporter.reportsEmitted();
    reporter.reportNow();
    EXPECT_EQ(reporter.reportsEmitted(), emitted + 1);
}

TEST_F(PersistenceShimTest, ReporterDisabledWithZeroInterval) {
    PersistenceShim& s = makeShim(false);
    MetricsReporter reporter(s, std::chrono::milliseconds(0));
    reporter.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    reporter.stop();
    EXPECT_EQ(reporter.reportsEmitted(), 0u);
}
