#include <batchstore/core/admin/metrics_reporter.hpp>
#include <spdlog/spdlog.h>

namespace BatchStore {

MetricsReporter::MetricsReporter(const PersistenceShim& shim, std::chrono::milliseconds interval)
    : shim_(shim), interval_(interval) {}

MetricsReporter::~MetricsReporter() noexcept {
    stop();
}

void MetricsReporter::start() {
    if (interval_.count() <= 0) {
        spdlog::info("[MetricsReporter] Periodic report disabled");
        return;
    }
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        spdlog::warn("[MetricsReporter] Already running");
        return;
    }
    worker_thread_ = std::thread(&MetricsReporter::loop, this);
    spdlog::info("[MetricsReporter] Started (interval: {}ms)", interval_.count());
}

void MetricsReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[MetricsReporter] Stopped");
    }
}

void MetricsReporter::loop() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mutex_);
            sleep_cv_.wait_for(lock, interval_, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        reportNow();
    }
}

void MetricsReporter::reportNow() const {
    MetricsReport report = shim_.metricsReport();
    reports_.fetch_add(1, std::memory_order_relaxed);

    if (!report.enabled) {
        spdlog::info("[MetricsReporter] Batching disabled, direct writes only");
        return;
    }

    const auto& m = report.metrics;
    auto log_level = (m.total_failed_flushes > 0 || m.total_records_dropped > 0)
        ? spdlog::level::warn
        : spdlog::level::info;

    spdlog::log(log_level, "╔════════════════════════════════════════════════════════════╗");
    spdlog::log(log_level, "║              BATCH WRITER REPORT                           ║");
    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");

    for (auto c : ALL_CATEGORIES) {
        const auto& cat = m.category(c);
        const char* status = (cat.failed_flushes == 0) ? "✓" : "✗";
        spdlog::log(log_level, "║ [{}] {:14} │ Buf: {:6} │ Commit: {:9} │ Fail: {:4} │ Drop: {:5} ║",
                    status, toString(c), report.bufferSize(c), cat.items_committed,
                    cat.failed_flushes, cat.records_dropped);
    }

    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");
    spdlog::log(log_level, "║ Flushes: {:8} │ size {:6} time {:6} ovf {:4} shut {:3} ║",
                m.total_flushes, m.flushesBy(FlushReason::SIZE_THRESHOLD),
                m.flushesBy(FlushReason::TIME_INTERVAL), m.flushesBy(FlushReason::BUFFER_OVERFLOW),
                m.flushesBy(FlushReason::SHUTDOWN));
    spdlog::log(log_level, "║ Batch: avg {:8.2f} │ min {:6} │ max {:6} │ retries {:6}   ║",
                m.avgBatchSize(), m.min_batch_size, m.max_batch_size, m.total_retries);
    spdlog::log(log_level, "║ Commit latency: p50 {:8}us │ p99 {:8}us │ max {:8}us ║",
                m.flush_p50_us, m.flush_p99_us, m.flush_max_us);
    spdlog::log(log_level, "╚════════════════════════════════════════════════════════════╝");
}

} // namespace BatchStore
