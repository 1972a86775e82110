// ============================================================================
// DEAD LETTER QUEUE UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <batchstore/core/records/dead_letter_queue.hpp>
#include "test_support.hpp"

using namespace BatchStore;
using BatchStoreTest::consumption;

TEST(DeadLetterQueue, StartsEmpty) {
    DeadLetterQueue dlq;
    EXPECT_EQ(dlq.totalDropped(), 0u);
    EXPECT_EQ(dlq.size(), 0u);
    EXPECT_TRUE(dlq.getRecent().empty());
}

TEST(DeadLetterQueue, PushBatchKeepsReasonAndOrder) {
    DeadLetterQueue dlq;
    std::vector<WriteRecord> batch;
    for (int i = 0; i < 3; ++i) batch.push_back(consumption(i));

    dlq.pushBatch(std::move(batch), "retry limit exceeded");
    EXPECT_EQ(dlq.totalDropped(), 3u);
    EXPECT_EQ(dlq.size(), 3u);

    auto recent = dlq.getRecent(2);
    ASSERT_EQ(recent.size(), 2u);
    // Newest first
    EXPECT_EQ(std::get<std::string>(recent[0].record.values()[2]), "msg-2");
    EXPECT_EQ(std::get<std::string>(recent[1].record.values()[2]), "msg-1");
    EXPECT_EQ(recent[0].reason, "retry limit exceeded");
}

TEST(DeadLetterQueue, EmptyBatchIgnored) {
    DeadLetterQueue dlq;
    dlq.pushBatch({}, "nothing");
    EXPECT_EQ(dlq.totalDropped(), 0u);
}

TEST(DeadLetterQueue, StoredRecordsAreBounded) {
    DeadLetterQueue dlq;
    std::vector<WriteRecord> batch;
    for (size_t i = 0; i < DeadLetterQueue::MAX_STORED_RECORDS + 50; ++i) {
        batch.push_back(consumption(static_cast<int>(i)));
    }
    dlq.pushBatch(std::move(batch), "overflow");

    EXPECT_EQ(dlq.totalDropped(), DeadLetterQueue::MAX_STORED_RECORDS + 50);
    EXPECT_EQ(dlq.size(), DeadLetterQueue::MAX_STORED_RECORDS);

    dlq.clear();
    EXPECT_EQ(dlq.size(), 0u);
    EXPECT_EQ(dlq.totalDropped(), DeadLetterQueue::MAX_STORED_RECORDS + 50);
}
