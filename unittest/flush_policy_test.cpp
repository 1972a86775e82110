// ============================================================================
// FLUSH POLICY UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <batchstore/core/flush/flush_policy.hpp>

using namespace BatchStore;

class FlushPolicyTest : public ::testing::Test {
protected:
    FlushPolicy policy{100, 50, 10000};
};

// ============================================================================
// TRIGGER TESTS
// ============================================================================

TEST_F(FlushPolicyTest, NothingToDoWhenEmptyAndFresh) {
    EXPECT_FALSE(policy.evaluate(0, 0, true, false).has_value());
    EXPECT_FALSE(policy.evaluate(0, 500, true, false).has_value());
}

TEST_F(FlushPolicyTest, SizeThreshold) {
    EXPECT_EQ(policy.evaluate(100, 0, true, false), FlushReason::SIZE_THRESHOLD);
    EXPECT_EQ(policy.evaluate(250, 3, true, false), FlushReason::SIZE_THRESHOLD);
    EXPECT_FALSE(policy.evaluate(99, 10, true, false).has_value());
}

TEST_F(FlushPolicyTest, TimeIntervalNeedsPendingRecords) {
    EXPECT_EQ(policy.evaluate(1, 50, true, false), FlushReason::TIME_INTERVAL);
    EXPECT_EQ(policy.evaluate(45, 60, true, false), FlushReason::TIME_INTERVAL);
    EXPECT_FALSE(policy.evaluate(45, 49, true, false).has_value());
}

TEST_F(FlushPolicyTest, SizeWinsOverTime) {
    EXPECT_EQ(policy.evaluate(150, 1000, true, false), FlushReason::SIZE_THRESHOLD);
}

TEST_F(FlushPolicyTest, ShutdownAlwaysFlushesEvenWhenEmpty) {
    EXPECT_EQ(policy.evaluate(0, 0, true, true), FlushReason::SHUTDOWN);
    EXPECT_EQ(policy.evaluate(500, 1000, true, true), FlushReason::SHUTDOWN);
}

TEST_F(FlushPolicyTest, DisabledNeverFlushesUntilShutdown) {
    EXPECT_FALSE(policy.evaluate(5000, 5000, false, false).has_value());
    EXPECT_FALSE(policy.evaluate(0, 5000, false, false).has_value());
}

TEST_F(FlushPolicyTest, ShutdownDrainsEvenWhenDisabled) {
    EXPECT_EQ(policy.evaluate(5000, 5000, false, true), FlushReason::SHUTDOWN);
    EXPECT_EQ(policy.evaluate(0, 0, false, true), FlushReason::SHUTDOWN);
}

TEST(FlushPolicy, OverflowWhenCapacityBelowBatchSize) {
    FlushPolicy tiny(10, 50, 5);
    EXPECT_EQ(tiny.evaluate(6, 0, true, false), FlushReason::BUFFER_OVERFLOW);
    EXPECT_EQ(tiny.evaluate(6, 50, true, false), FlushReason::TIME_INTERVAL);
}

TEST(FlushPolicy, ReasonNames) {
    EXPECT_STREQ(toString(FlushReason::SIZE_THRESHOLD), "size");
    EXPECT_STREQ(toString(FlushReason::TIME_INTERVAL), "time");
    EXPECT_STREQ(toString(FlushReason::SHUTDOWN), "shutdown");
    EXPECT_STREQ(toString(FlushReason::BUFFER_OVERFLOW), "overflow");
    EXPECT_STREQ(toString(FlushReason::MANUAL), "manual");
}
