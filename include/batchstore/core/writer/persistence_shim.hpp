#pragma once

#include <batchstore/core/writer/batch_writer.hpp>
#include <array>
#include <memory>
#include <string>

namespace BatchStore {

/**
 * @brief Monitoring view: counters, derived stats and live buffer sizes
 */
struct MetricsReport {
    bool enabled = false;
    BatchMetricsSnapshot metrics;
    std::array<size_t, CATEGORY_COUNT> buffer_sizes{};
    size_t dead_letters = 0;

    size_t bufferSize(Category c) const { return buffer_sizes[categoryIndex(c)]; }
};

/**
 * @class PersistenceShim
 * @brief Entry points called by the broker for every persisted event.
 *
 * Batching enabled: records go to the BatchWriter; a full buffer applies
 * backpressure by flushing synchronously on the caller's thread.
 * Batching disabled: every call is its own single-row transaction.
 *
 * Arity is validated here, before anything is buffered.
 */
class PersistenceShim {
public:
    PersistenceShim(const AppConfig::BatchWriterConfig& config, BatchExecutor& executor);
    ~PersistenceShim() noexcept;

    PersistenceShim(const PersistenceShim&) = delete;
    PersistenceShim& operator=(const PersistenceShim&) = delete;

    void start();

    /**
     * @throws RecordArityError on column count mismatch
     * @throws EnqueueRejected when backpressure cannot be applied (batching)
     * @throws StoreError when the single-row write fails (no batching)
     */
    void recordMessage(ColumnValues values);
    void recordConsumption(ColumnValues values);
    void recordSubscription(ColumnValues values);

    // Typed forms matching the fixed column order
    void recordMessage(const std::string& topic, const std::string& message_id,
                       const std::string& message, const std::string& producer, double timestamp);
    void recordConsumption(const std::string& consumer, const std::string& topic,
                           const std::string& message_id, const std::string& message,
                           double timestamp);
    void recordSubscription(const std::string& sid, const std::string& consumer,
                            const std::string& topic, double connected_at);

    bool flushAll();
    ShutdownReport shutdown();

    MetricsReport metricsReport() const;

    bool batchingEnabled() const { return writer_ != nullptr; }

    // nullptr when batching is disabled
    BatchWriter* writer() { return writer_.get(); }

private:
    void record(Category category, ColumnValues values);

    BatchExecutor& executor_;
    std::unique_ptr<BatchWriter> writer_;
};

} // namespace BatchStore
