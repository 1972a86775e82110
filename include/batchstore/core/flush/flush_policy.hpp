#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>

namespace BatchStore {

enum class FlushReason : uint8_t {
    SIZE_THRESHOLD = 0,
    TIME_INTERVAL = 1,
    SHUTDOWN = 2,
    BUFFER_OVERFLOW = 3,
    MANUAL = 4          // Explicit flushAll(), never produced by the policy
};

constexpr size_t FLUSH_REASON_COUNT = 5;

const char* toString(FlushReason reason);

/**
 * @class FlushPolicy
 * @brief Stateless per-category flush decision
 *
 * Priority order:
 *   shutdown -> SHUTDOWN (even when empty or batching is disabled)
 *   batching disabled -> no flush
 *   size >= batch_size -> SIZE_THRESHOLD
 *   size > 0 && elapsed >= interval -> TIME_INTERVAL
 *   size >= max_buffer_size -> BUFFER_OVERFLOW (safety net)
 */
class FlushPolicy {
public:
    FlushPolicy(size_t batch_size, uint64_t flush_interval_ms, size_t max_buffer_size);

    std::optional<FlushReason> evaluate(size_t buffer_size,
                                        uint64_t ms_since_last_flush,
                                        bool batching_enabled,
                                        bool shutting_down) const;

    size_t batchSize() const { return batch_size_; }
    uint64_t flushIntervalMs() const { return flush_interval_ms_; }

private:
    size_t batch_size_;
    uint64_t flush_interval_ms_;
    size_t max_buffer_size_;
};

} // namespace BatchStore
