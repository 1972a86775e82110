#pragma once

#include <batchstore/core/records/write_record.hpp>
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace BatchStore {

/**
 * @class DeadLetterQueue
 * @brief Keeps track of batches dropped after the retry bound was exceeded.
 *
 * - Tracks total dropped count (atomic)
 * - Stores the most recent N records for inspection (ring buffer)
 * - Thread-safe push operations
 */
class DeadLetterQueue {
public:
    static constexpr size_t MAX_STORED_RECORDS = 1000;

    struct DroppedRecord {
        WriteRecord record;
        std::string reason;
    };

    DeadLetterQueue();
    ~DeadLetterQueue() = default;

    /**
     * @brief Take ownership of a dropped batch
     * @param records Records that will never be committed
     * @param reason Last failure cause (logged and stored with each record)
     */
    void pushBatch(std::vector<WriteRecord>&& records, const std::string& reason);

    size_t totalDropped() const {
        return total_dropped_.load(std::memory_order_relaxed);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_.size();
    }

    /**
     * @brief Most recent dropped records, newest first
     */
    std::vector<DroppedRecord> getRecent(size_t max_count = 100) const;

    void clear();

private:
    std::atomic<size_t> total_dropped_{0};
    mutable std::mutex mutex_;
    std::deque<DroppedRecord> stored_;
};

} // namespace BatchStore
