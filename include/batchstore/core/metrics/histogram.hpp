#pragma once

#include <array>
#include <atomic>
#include <algorithm>
#include <cstdint>
#include <cstddef>

namespace BatchStore {

/**
 * @brief Lock-free flush latency histogram using log2 buckets
 *
 * Bucket k covers [2^k, 2^(k+1)) microseconds; bucket 0 also holds 0.
 * record() is safe from any thread. Percentiles are approximate: the upper
 * bound of the bucket containing the requested rank is returned.
 */
class LatencyHistogram {
public:
    static constexpr size_t NUM_BUCKETS = 40;   // up to ~2^40 us (~12 days)

    void record(uint64_t latency_us) {
        buckets_[bucketFor(latency_us)].fetch_add(1, std::memory_order_relaxed);
        total_count_.fetch_add(1, std::memory_order_relaxed);

        uint64_t prev = max_us_.load(std::memory_order_relaxed);
        while (latency_us > prev &&
               !max_us_.compare_exchange_weak(prev, latency_us, std::memory_order_relaxed)) {
        }
    }

    uint64_t totalCount() const {
        return total_count_.load(std::memory_order_relaxed);
    }

    uint64_t maxValue() const {
        return max_us_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Approximate percentile (0-100), 0 when empty
     */
    uint64_t percentile(double pct) const {
        uint64_t total = totalCount();
        if (total == 0) return 0;

        pct = std::clamp(pct, 0.0, 100.0);
        uint64_t rank = static_cast<uint64_t>((pct / 100.0) * static_cast<double>(total));
        if (rank == 0) rank = 1;

        uint64_t seen = 0;
        for (size_t b = 0; b < NUM_BUCKETS; ++b) {
            seen += buckets_[b].load(std::memory_order_relaxed);
            if (seen >= rank) {
                return std::min(bucketMax(b), maxValue());
            }
        }
        return maxValue();
    }

    void reset() {
        for (auto& b : buckets_) {
            b.store(0, std::memory_order_relaxed);
        }
        total_count_.store(0, std::memory_order_relaxed);
        max_us_.store(0, std::memory_order_relaxed);
    }

private:
    std::array<std::atomic<uint64_t>, NUM_BUCKETS> buckets_{};
    std::atomic<uint64_t> total_count_{0};
    std::atomic<uint64_t> max_us_{0};

    static size_t bucketFor(uint64_t latency_us) {
        if (latency_us <= 1) return 0;
        size_t msb = static_cast<size_t>(63 - __builtin_clzll(latency_us));
        return std::min(msb, NUM_BUCKETS - 1);
    }

    static uint64_t bucketMax(size_t bucket) {
        return (1ULL << (bucket + 1)) - 1;
    }
};

} // namespace BatchStore
