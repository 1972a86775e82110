#pragma once

#include <batchstore/core/records/write_record.hpp>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace BatchStore {

enum class EnqueueStatus : uint8_t {
    ACCEPTED = 0,   // Record appended
    FULL = 1,       // At maxBufferSize, record NOT appended (force a flush first)
    CLOSED = 2      // Buffer closed by shutdown
};

/**
 * @class CategoryBuffer
 * @brief FIFO of pending records for one category.
 *
 * All operations hold the buffer mutex only for the duration of the
 * container operation itself; no I/O ever happens under it.
 * Lifecycle: Empty -> Accumulating -> (take) -> Empty.
 *
 * Records handed out by take()/takeAll() stay reserved against capacity
 * until the flush resolves them with release() (committed or dropped) or
 * requeueFront() (retry). A failed batch therefore always fits back.
 */
class CategoryBuffer {
public:
    CategoryBuffer(Category category, size_t max_buffer_size);
    ~CategoryBuffer() = default;

    CategoryBuffer(const CategoryBuffer&) = delete;
    CategoryBuffer& operator=(const CategoryBuffer&) = delete;

    /**
     * @brief Append a record (amortized O(1))
     * The record is only moved from when ACCEPTED is returned.
     * FULL when pending + reserved records reach maxBufferSize.
     */
    EnqueueStatus enqueue(WriteRecord&& record);

    /**
     * @brief Swap out all pending records, leaving the buffer empty
     */
    std::vector<WriteRecord> takeAll();

    /**
     * @brief Remove up to max_count oldest records
     */
    std::vector<WriteRecord> take(size_t max_count);

    /**
     * @brief Give up the reservation of taken records that left for good
     */
    void release(size_t count);

    /**
     * @brief Put a failed batch back ahead of newer records
     * The batch's reservation becomes pending records again.
     */
    void requeueFront(std::vector<WriteRecord>&& records);

    void close();
    bool isClosed() const;

    // Best-effort snapshot under concurrency
    size_t size() const;

    // Records taken by a flush that has not resolved yet
    size_t reserved() const;

    bool isFull() const;

    Category category() const { return category_; }
    size_t capacity() const { return max_buffer_size_; }

private:
    const Category category_;
    const size_t max_buffer_size_;

    mutable std::mutex mutex_;
    std::deque<WriteRecord> records_;
    size_t reserved_ = 0;
    bool closed_ = false;
};

} // namespace BatchStore
