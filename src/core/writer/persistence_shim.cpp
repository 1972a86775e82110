#include <batchstore/core/writer/persistence_shim.hpp>
#include <batchstore/core/errors.hpp>
#include <spdlog/spdlog.h>

namespace BatchStore {

PersistenceShim::PersistenceShim(const AppConfig::BatchWriterConfig& config, BatchExecutor& executor)
    : executor_(executor) {
    if (config.enabled) {
        writer_ = std::make_unique<BatchWriter>(config, executor_);
    }
    spdlog::info("[PersistenceShim] Batch writes {}", config.enabled ? "enabled" : "disabled");
}

PersistenceShim::~PersistenceShim() noexcept {
    spdlog::debug("[DESTRUCTOR] PersistenceShim being destroyed...");
}

void PersistenceShim::start() {
    if (writer_) {
        writer_->start();
    }
}

void PersistenceShim::record(Category category, ColumnValues values) {
    WriteRecord rec = WriteRecord::create(category, std::move(values),
                                          executor_.spec(category).column_count);
    if (writer_) {
        writer_->submit(std::move(rec));
        return;
    }

    std::vector<WriteRecord> single;
    single.push_back(std::move(rec));
    BatchOutcome outcome = executor_.executeBatch(category, single);
    if (!outcome.committed()) {
        throw StoreError(std::string("write to ") + toString(category) + " failed: " + outcome.error);
    }
}

void PersistenceShim::recordMessage(ColumnValues values) {
    record(Category::MESSAGE, std::move(values));
}

void PersistenceShim::recordConsumption(ColumnValues values) {
    record(Category::CONSUMPTION, std::move(values));
}

void PersistenceShim::recordSubscription(ColumnValues values) {
    record(Category::SUBSCRIPTION, std::move(values));
}

void PersistenceShim::recordMessage(const std::string& topic, const std::string& message_id,
                                    const std::string& message, const std::string& producer,
                                    double timestamp) {
    record(Category::MESSAGE, {topic, message_id, message, producer, timestamp});
}

void PersistenceShim::recordConsumption(const std::string& consumer, const std::string& topic,
                                        const std::string& message_id, const std::string& message,
                                        double timestamp) {
    record(Category::CONSUMPTION, {consumer, topic, message_id, message, timestamp});
}

void PersistenceShim::recordSubscription(const std::string& sid, const std::string& consumer,
                                         const std::string& topic, double connected_at) {
    record(Category::SUBSCRIPTION, {sid, consumer, topic, connected_at});
}

bool PersistenceShim::flushAll() {
    return writer_ ? writer_->flushAll() : true;
}

ShutdownReport PersistenceShim::shutdown() {
    return writer_ ? writer_->shutdown() : ShutdownReport{};
}

MetricsReport PersistenceShim::metricsReport() const {
    MetricsReport report;
    report.enabled = writer_ != nullptr;
    if (writer_) {
        report.metrics = writer_->metrics();
        report.buffer_sizes = writer_->bufferSizes();
        report.dead_letters = writer_->deadLetters().totalDropped();
    }
    return report;
}

} // namespace BatchStore
