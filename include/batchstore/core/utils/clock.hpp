// ============================================================================
// MONOTONIC + WALL CLOCK HELPERS

#pragma once

#include <chrono>
#include <cstdint>

namespace BatchStore {

class Clock {
public:
    using SteadyTime = std::chrono::steady_clock::time_point;

    static inline SteadyTime now() {
        return std::chrono::steady_clock::now();
    }

    // Monotonic milliseconds, used for flush intervals
    static inline uint64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()
        ).count();
    }

    static inline uint64_t now_us() {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            now().time_since_epoch()
        ).count();
    }

    // Wall-clock epoch milliseconds, used for reporting only
    static inline uint64_t wall_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

    static inline uint64_t elapsed_us(SteadyTime since) {
        return std::chrono::duration_cast<std::chrono::microseconds>(now() - since).count();
    }
};

} // namespace BatchStore
