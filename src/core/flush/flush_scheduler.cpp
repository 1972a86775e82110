#include <batchstore/core/flush/flush_scheduler.hpp>
#include <batchstore/core/writer/batch_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace BatchStore {

FlushScheduler::FlushScheduler(BatchWriter& writer, const FlushPolicy& policy, size_t workers)
    : writer_(writer),
      policy_(policy),
      tick_(std::max<std::chrono::milliseconds::rep>(
          1, static_cast<std::chrono::milliseconds::rep>(policy.flushIntervalMs() / 2))),
      pool_(std::max<size_t>(1, workers)) {}

FlushScheduler::~FlushScheduler() noexcept {
    stop();
    pool_.shutdown();
}

void FlushScheduler::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        spdlog::warn("[FlushScheduler] Already running");
        return;
    }
    thread_ = std::thread(&FlushScheduler::loop, this);
    spdlog::info("[FlushScheduler] Started (tick: {}ms, interval: {}ms, batch_size: {})",
                 tick_.count(), policy_.flushIntervalMs(), policy_.batchSize());
}

void FlushScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("[FlushScheduler] Stopped");
    }
}

void FlushScheduler::notify(Category category) {
    if (!running_.load(std::memory_order_acquire) ||
        in_flight_[categoryIndex(category)].load(std::memory_order_acquire)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        wake_ = true;
    }
    sleep_cv_.notify_one();
}

bool FlushScheduler::waitIdle(Clock::SteadyTime deadline) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_until(lock, deadline, [this] { return outstanding_ == 0; });
}

void FlushScheduler::shutdownWorkers() {
    pool_.shutdown();
}

size_t FlushScheduler::outstanding() const {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    return outstanding_;
}

void FlushScheduler::loop() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, tick_, [this] {
                return wake_ || !running_.load(std::memory_order_acquire);
            });
            wake_ = false;
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        try {
            tick();
        } catch (const std::exception& e) {
            spdlog::error("[FlushScheduler] Error in flush loop: {}", e.what());
        }
    }
}

void FlushScheduler::tick() {
    for (auto c : ALL_CATEGORIES) {
        if (in_flight_[categoryIndex(c)].load(std::memory_order_acquire)) {
            continue;
        }
        auto reason = policy_.evaluate(writer_.bufferSize(c),
                                       writer_.msSinceLastFlush(c),
                                       writer_.config().enabled,
                                       false);
        if (reason) {
            dispatch(c, *reason);
        }
    }
}

void FlushScheduler::dispatch(Category category, FlushReason reason) {
    in_flight_[categoryIndex(category)].store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        ++outstanding_;
    }

    bool queued = pool_.submit([this, category, reason] { runFlush(category, reason); });
    if (!queued) {
        in_flight_[categoryIndex(category)].store(false, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            --outstanding_;
        }
        idle_cv_.notify_all();
        spdlog::warn("[FlushScheduler] Worker pool stopped, {} flush not dispatched",
                     toString(category));
    }
}

void FlushScheduler::runFlush(Category category, FlushReason reason) {
    try {
        if (reason == FlushReason::SIZE_THRESHOLD) {
            // Drain full batches; the remainder waits for the time trigger
            do {
                BatchOutcome outcome = writer_.flushCategory(category, reason);
                if (!outcome.committed() || outcome.count == 0) break;
            } while (running_.load(std::memory_order_acquire) &&
                     writer_.bufferSize(category) >= policy_.batchSize());
        } else {
            writer_.flushCategory(category, reason);
        }
    } catch (const std::exception& e) {
        spdlog::error("[FlushScheduler] {} flush of {} threw: {}",
                      toString(reason), toString(category), e.what());
    }

    in_flight_[categoryIndex(category)].store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        --outstanding_;
    }
    idle_cv_.notify_all();
}

} // namespace BatchStore
