#include <batchstore/core/writer/batch_writer.hpp>
#include <batchstore/core/config/loader.hpp>
#include <batchstore/core/errors.hpp>
#include <spdlog/spdlog.h>

namespace BatchStore {

const char* toString(ShutdownStatus status) {
    switch (status) {
        case ShutdownStatus::COMPLETED:     return "COMPLETED";
        case ShutdownStatus::DRAIN_FAILED:  return "DRAIN_FAILED";
        case ShutdownStatus::TIMED_OUT:     return "TIMED_OUT";
        default:                            return "UNKNOWN";
    }
}

BatchWriter::BatchWriter(const AppConfig::BatchWriterConfig& config, BatchExecutor& executor)
    : config_(config),
      policy_(config.batchSize, config.flushIntervalMs, config.maxBufferSize),
      executor_(executor) {
    ConfigLoader::validate(config_);

    const uint64_t now = Clock::now_ms();
    for (auto c : ALL_CATEGORIES) {
        slots_[categoryIndex(c)] = std::make_unique<CategorySlot>(c, config_.maxBufferSize);
        slots_[categoryIndex(c)]->last_flush_ms.store(now, std::memory_order_relaxed);
    }
    scheduler_ = std::make_unique<FlushScheduler>(*this, policy_, config_.flushWorkers);

    spdlog::info("[BatchWriter] Initialized: batch_size={}, flush_interval={}ms, max_buffer={}, max_retries={}",
                 config_.batchSize, config_.flushIntervalMs, config_.maxBufferSize, config_.maxRetries);
}

BatchWriter::~BatchWriter() noexcept {
    try {
        if (!isShutDown()) {
            ShutdownReport report = shutdown();
            if (!report.ok()) {
                spdlog::error("[DESTRUCTOR] BatchWriter shutdown ended with {} ({} records not committed)",
                              toString(report.status), report.records_not_committed);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[DESTRUCTOR] BatchWriter shutdown threw: {}", e.what());
    }
}

void BatchWriter::start() {
    if (isShutDown()) {
        spdlog::warn("[BatchWriter] start() after shutdown ignored");
        return;
    }
    scheduler_->start();
}

void BatchWriter::submit(WriteRecord record) {
    const Category c = record.category();
    CategorySlot& s = slot(c);

    while (true) {
        switch (s.buffer.enqueue(std::move(record))) {
            case EnqueueStatus::ACCEPTED:
                metrics_.recordEnqueued(c);
                if (s.buffer.size() >= config_.batchSize) {
                    scheduler_->notify(c);
                }
                return;

            case EnqueueStatus::CLOSED:
                throw EnqueueRejected(std::string("writer is shut down, ") + toString(c)
                                      + " record rejected");

            case EnqueueStatus::FULL: {
                spdlog::warn("[BatchWriter] Buffer for {} is full ({}), forcing flush",
                             toString(c), config_.maxBufferSize);
                BatchOutcome outcome = flushCategory(c, FlushReason::BUFFER_OVERFLOW);
                if (!outcome.committed() && s.buffer.isFull()) {
                    throw EnqueueRejected("forced flush of " + std::string(toString(c))
                                          + " failed: " + outcome.error);
                }
                break;  // retry the append
            }
        }
    }
}

BatchOutcome BatchWriter::flushCategory(Category category, FlushReason reason) {
    CategorySlot& s = slot(category);
    std::lock_guard<std::timed_mutex> lock(s.flush_mutex);
    return flushLocked(s, reason);
}

BatchOutcome BatchWriter::flushLocked(CategorySlot& s, FlushReason reason,
                                      std::optional<Clock::SteadyTime> deadline) {
    const Category c = s.buffer.category();

    std::vector<WriteRecord> records = (reason == FlushReason::SIZE_THRESHOLD)
        ? s.buffer.take(config_.batchSize)
        : s.buffer.takeAll();

    // Only the shutdown drain records a no-op flush
    if (records.empty() && reason != FlushReason::SHUTDOWN) {
        return BatchOutcome::success(0);
    }

    FlushEvent event;
    event.category = c;
    event.reason = reason;
    event.record_count = records.size();
    event.started_at_ms = Clock::wall_ms();

    auto started = Clock::now();
    BatchOutcome outcome = deadline
        ? executor_.executeBatch(c, records, *deadline)
        : executor_.executeBatch(c, records);

    if (outcome.outcome == FlushOutcome::TIMED_OUT) {
        // Never attempted, so no failure is counted
        s.buffer.requeueFront(std::move(records));
        return outcome;
    }

    event.duration_us = Clock::elapsed_us(started);
    event.outcome = outcome.outcome;

    s.last_flush_ms.store(Clock::now_ms(), std::memory_order_release);
    metrics_.record(event);

    if (outcome.committed()) {
        s.buffer.release(records.size());
        s.consecutive_failures = 0;
        if (!records.empty()) {
            spdlog::debug("[BatchWriter] Flushed {} {} records (reason: {}, {:.2f}ms)",
                          records.size(), toString(c), toString(reason), event.durationMs());
        }
    } else {
        spdlog::error("[BatchWriter] Failed to flush {} {} records (reason: {}): {}",
                      records.size(), toString(c), toString(reason), outcome.error);
        handleFailedBatch(s, std::move(records), reason, outcome.error);
    }
    return outcome;
}

void BatchWriter::handleFailedBatch(CategorySlot& s, std::vector<WriteRecord>&& records,
                                    FlushReason reason, const std::string& error) {
    const Category c = s.buffer.category();
    const size_t count = records.size();
    ++s.consecutive_failures;

    std::string drop_reason;
    if (reason == FlushReason::SHUTDOWN) {
        drop_reason = "shutdown drain failed: " + error;
    } else if (s.consecutive_failures > config_.maxRetries) {
        drop_reason = "retry limit (" + std::to_string(config_.maxRetries) + ") exceeded: " + error;
    } else {
        // Still reserved against capacity, so the batch always fits back
        s.buffer.requeueFront(std::move(records));
        metrics_.recordRetry(c);
        spdlog::warn("[BatchWriter] Requeued {} {} records for retry {}/{}",
                     count, toString(c), s.consecutive_failures, config_.maxRetries);
        return;
    }

    s.consecutive_failures = 0;
    s.buffer.release(count);
    metrics_.recordDropped(c, count);
    dead_letters_.pushBatch(std::move(records), drop_reason);
}

bool BatchWriter::flushAll() {
    spdlog::info("[BatchWriter] Force flushing all buffers");
    bool all_committed = true;
    for (auto c : ALL_CATEGORIES) {
        if (!flushCategory(c, FlushReason::MANUAL).committed()) {
            all_committed = false;
        }
    }
    return all_committed;
}

ShutdownReport BatchWriter::shutdown() {
    return shutdown(std::chrono::milliseconds(config_.shutdownTimeoutMs));
}

ShutdownReport BatchWriter::shutdown(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
        return ShutdownReport{};
    }

    spdlog::info("[BatchWriter] Stopping and flushing pending writes...");
    const auto deadline = Clock::now() + timeout;

    // No enqueue can slip in after the drain takes the buffer
    for (auto& s : slots_) {
        s->buffer.close();
    }
    scheduler_->stop();

    ShutdownReport report;
    bool drain_failed = false;
    bool timed_out = false;

    for (auto& s : slots_) {
        const Category c = s->buffer.category();
        if (Clock::now() >= deadline) {
            timed_out = true;
            // Reserved records belong to a flush that has not finished
            report.records_not_committed += s->buffer.size() + s->buffer.reserved();
            spdlog::error("[BatchWriter] Deadline passed, {} drain skipped", toString(c));
            continue;
        }

        std::unique_lock<std::timed_mutex> lock(s->flush_mutex, std::defer_lock);
        if (!lock.try_lock_until(deadline)) {
            timed_out = true;
            report.records_not_committed += s->buffer.size() + s->buffer.reserved();
            spdlog::error("[BatchWriter] Timed out waiting for in-flight {} flush", toString(c));
            continue;
        }
        // Buffer is closed and the flush mutex is held: size is exact
        const size_t pending = s->buffer.size();
        BatchOutcome outcome = flushLocked(*s, FlushReason::SHUTDOWN, deadline);
        if (outcome.outcome == FlushOutcome::TIMED_OUT) {
            timed_out = true;
            report.records_not_committed += pending;
        } else if (!outcome.committed()) {
            drain_failed = true;
            report.records_not_committed += pending;
        }
    }
    if (Clock::now() > deadline) {
        timed_out = true;
    }

    if (!scheduler_->waitIdle(deadline)) {
        timed_out = true;
        report.flushes_outstanding = scheduler_->outstanding();
    } else {
        scheduler_->shutdownWorkers();
    }

    if (timed_out) {
        report.status = ShutdownStatus::TIMED_OUT;
        spdlog::error("[BatchWriter] Shutdown timed out after {}ms ({} records, {} flushes outstanding)",
                      timeout.count(), report.records_not_committed, report.flushes_outstanding);
    } else if (drain_failed) {
        report.status = ShutdownStatus::DRAIN_FAILED;
        spdlog::error("[BatchWriter] Shutdown drain failed, {} records not committed",
                      report.records_not_committed);
    } else {
        spdlog::info("[BatchWriter] Stopped, all buffers drained");
    }
    return report;
}

size_t BatchWriter::bufferSize(Category category) const {
    return slot(category).buffer.size();
}

std::array<size_t, CATEGORY_COUNT> BatchWriter::bufferSizes() const {
    std::array<size_t, CATEGORY_COUNT> sizes{};
    for (auto c : ALL_CATEGORIES) {
        sizes[categoryIndex(c)] = bufferSize(c);
    }
    return sizes;
}

uint64_t BatchWriter::msSinceLastFlush(Category category) const {
    uint64_t last = slot(category).last_flush_ms.load(std::memory_order_acquire);
    uint64_t now = Clock::now_ms();
    return now > last ? now - last : 0;
}

} // namespace BatchStore
