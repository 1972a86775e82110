#pragma once

#include <batchstore/core/buffer/category_buffer.hpp>
#include <batchstore/core/config/app_config.hpp>
#include <batchstore/core/flush/flush_policy.hpp>
#include <batchstore/core/flush/flush_scheduler.hpp>
#include <batchstore/core/metrics/batch_metrics.hpp>
#include <batchstore/core/records/dead_letter_queue.hpp>
#include <batchstore/core/storage/batch_executor.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace BatchStore {

enum class ShutdownStatus : uint8_t {
    COMPLETED = 0,      // Every buffered record committed
    DRAIN_FAILED = 1,   // A drain transaction failed; its records went to the DLQ
    TIMED_OUT = 2       // Budget elapsed; pending records presumed not durable
};

const char* toString(ShutdownStatus status);

struct ShutdownReport {
    ShutdownStatus status = ShutdownStatus::COMPLETED;
    size_t records_not_committed = 0;
    size_t flushes_outstanding = 0;

    bool ok() const { return status == ShutdownStatus::COMPLETED; }
};

/**
 * @class BatchWriter
 * @brief Context object owning the category buffers, config, metrics and
 *        flush scheduler. No global state: independent instances can coexist.
 *
 * Flush protocol per category: lock flush mutex -> take snapshot (short
 * buffer lock) -> commit without any buffer lock -> update metrics.
 * The flush mutex is never taken by enqueue, so producers keep appending
 * while a commit is in flight.
 */
class BatchWriter {
public:
    BatchWriter(const AppConfig::BatchWriterConfig& config, BatchExecutor& executor);
    ~BatchWriter() noexcept;

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    /**
     * @brief Start the background flush scheduler
     */
    void start();

    /**
     * @brief Append a record to its category buffer.
     *
     * A full buffer is flushed synchronously (BUFFER_OVERFLOW) before the
     * record is appended.
     * @throws EnqueueRejected if that flush fails or the writer is shut down
     */
    void submit(WriteRecord record);

    /**
     * @brief Flush one category synchronously
     *
     * SIZE_THRESHOLD takes exactly batch_size records, every other reason
     * takes the whole buffer. Failed batches follow the retry/drop policy.
     */
    BatchOutcome flushCategory(Category category, FlushReason reason);

    /**
     * @brief Flush every category now (MANUAL)
     * @return true if every non-empty category committed
     */
    bool flushAll();

    /**
     * @brief Close buffers, stop the scheduler and drain everything
     *
     * The timeout bounds the whole drain: categories reached after the
     * deadline are skipped and the report is TIMED_OUT. Records held by a
     * flush still in flight count as not committed.
     * Idempotent: later calls return COMPLETED without flushing.
     */
    ShutdownReport shutdown();
    ShutdownReport shutdown(std::chrono::milliseconds timeout);

    size_t bufferSize(Category category) const;
    std::array<size_t, CATEGORY_COUNT> bufferSizes() const;
    uint64_t msSinceLastFlush(Category category) const;

    BatchMetricsSnapshot metrics() const { return metrics_.snapshot(); }
    const DeadLetterQueue& deadLetters() const { return dead_letters_; }
    const AppConfig::BatchWriterConfig& config() const { return config_; }
    bool isShutDown() const { return shut_down_.load(std::memory_order_acquire); }

private:
    struct CategorySlot {
        CategorySlot(Category c, size_t capacity) : buffer(c, capacity) {}

        CategoryBuffer buffer;
        std::timed_mutex flush_mutex;               // held across take + commit
        std::atomic<uint64_t> last_flush_ms{0};
        uint32_t consecutive_failures = 0;          // guarded by flush_mutex
    };

    CategorySlot& slot(Category c) { return *slots_[categoryIndex(c)]; }
    const CategorySlot& slot(Category c) const { return *slots_[categoryIndex(c)]; }

    // Must be called while holding s.flush_mutex
    BatchOutcome flushLocked(CategorySlot& s, FlushReason reason,
                             std::optional<Clock::SteadyTime> deadline = std::nullopt);
    void handleFailedBatch(CategorySlot& s, std::vector<WriteRecord>&& records,
                           FlushReason reason, const std::string& error);

    const AppConfig::BatchWriterConfig config_;
    const FlushPolicy policy_;
    BatchExecutor& executor_;

    MetricsCollector metrics_;
    DeadLetterQueue dead_letters_;
    std::array<std::unique_ptr<CategorySlot>, CATEGORY_COUNT> slots_;

    std::mutex shutdown_mutex_;
    std::atomic<bool> shut_down_{false};

    // Declared last: its workers call back into this object
    std::unique_ptr<FlushScheduler> scheduler_;
};

} // namespace BatchStore
