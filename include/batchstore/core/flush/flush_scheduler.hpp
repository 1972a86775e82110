#pragma once

#include <batchstore/core/flush/flush_policy.hpp>
#include <batchstore/core/records/category.hpp>
#include <batchstore/core/utils/clock.hpp>
#include <batchstore/core/utils/thread_pool.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace BatchStore {

class BatchWriter;

/**
 * @class FlushScheduler
 * @brief Background timer loop that evaluates the flush policy per category.
 *
 * Ticks every flush_interval / 2 (>= 1ms); the per-category "time since last
 * flush" check keeps the effective time-based cadence at flush_interval.
 * Flushes run on a worker pool so a slow commit on one category never stalls
 * evaluation of the others. At most one dispatched flush per category is
 * outstanding at any time.
 */
class FlushScheduler {
public:
    FlushScheduler(BatchWriter& writer, const FlushPolicy& policy, size_t workers);
    ~FlushScheduler() noexcept;

    FlushScheduler(const FlushScheduler&) = delete;
    FlushScheduler& operator=(const FlushScheduler&) = delete;

    void start();

    /**
     * @brief Stop the timer loop; already dispatched flushes keep running
     */
    void stop();

    /**
     * @brief Wake the loop early (a buffer reached batch_size)
     */
    void notify(Category category);

    /**
     * @brief Wait until no dispatched flush is outstanding
     * @return false if the deadline passed first
     */
    bool waitIdle(Clock::SteadyTime deadline);

    /**
     * @brief Join the worker pool (call only after waitIdle succeeded)
     */
    void shutdownWorkers();

    size_t outstanding() const;

private:
    void loop();
    void tick();
    void dispatch(Category category, FlushReason reason);
    void runFlush(Category category, FlushReason reason);

    BatchWriter& writer_;
    FlushPolicy policy_;
    std::chrono::milliseconds tick_;
    ThreadPool pool_;

    std::array<std::atomic<bool>, CATEGORY_COUNT> in_flight_{};
    std::atomic<bool> running_{false};
    std::thread thread_;

    // Interruptible sleep
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
    bool wake_ = false;

    mutable std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
    size_t outstanding_ = 0;
};

} // namespace BatchStore
