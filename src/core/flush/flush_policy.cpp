#include <batchstore/core/flush/flush_policy.hpp>

namespace BatchStore {

const char* toString(FlushReason reason) {
    switch (reason) {
        case FlushReason::SIZE_THRESHOLD:   return "size";
        case FlushReason::TIME_INTERVAL:    return "time";
        case FlushReason::SHUTDOWN:         return "shutdown";
        case FlushReason::BUFFER_OVERFLOW:  return "overflow";
        case FlushReason::MANUAL:           return "manual";
        default:                            return "unknown";
    }
}

FlushPolicy::FlushPolicy(size_t batch_size, uint64_t flush_interval_ms, size_t max_buffer_size)
    : batch_size_(batch_size),
      flush_interval_ms_(flush_interval_ms),
      max_buffer_size_(max_buffer_size) {}

std::optional<FlushReason> FlushPolicy::evaluate(size_t buffer_size,
                                                 uint64_t ms_since_last_flush,
                                                 bool batching_enabled,
                                                 bool shutting_down) const {
    // The final drain runs regardless of batching
    if (shutting_down) {
        return FlushReason::SHUTDOWN;
    }
    if (!batching_enabled) {
        return std::nullopt;
    }
    // Size wins over time when both hold, so metrics classify it correctly
    if (buffer_size >= batch_size_) {
        return FlushReason::SIZE_THRESHOLD;
    }
    if (buffer_size > 0 && ms_since_last_flush >= flush_interval_ms_) {
        return FlushReason::TIME_INTERVAL;
    }
    // Unreachable while batch_size < max_buffer_size, kept as a safety net
    if (buffer_size >= max_buffer_size_) {
        return FlushReason::BUFFER_OVERFLOW;
    }
    return std::nullopt;
}

} // namespace BatchStore
