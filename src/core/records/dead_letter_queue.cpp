#include <batchstore/core/records/dead_letter_queue.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace BatchStore {

DeadLetterQueue::DeadLetterQueue() {
    spdlog::debug("[DeadLetterQueue] Initialized (max stored: {})", MAX_STORED_RECORDS);
}

void DeadLetterQueue::pushBatch(std::vector<WriteRecord>&& records, const std::string& reason) {
    if (records.empty()) return;

    const size_t count = records.size();
    const Category category = records.front().category();
    total_dropped_.fetch_add(count, std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& r : records) {
            if (stored_.size() >= MAX_STORED_RECORDS) {
                stored_.pop_front();
            }
            stored_.push_back(DroppedRecord{std::move(r), reason});
        }
    }
    records.clear();

    spdlog::error("[DLQ] Dropped batch of {} {} records: {} (total: {})",
                  count, toString(category), reason,
                  total_dropped_.load(std::memory_order_relaxed));
}

std::vector<DeadLetterQueue::DroppedRecord> DeadLetterQueue::getRecent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DroppedRecord> result;
    size_t count = std::min(max_count, stored_.size());
    result.reserve(count);

    auto it = stored_.rbegin();
    for (size_t i = 0; i < count && it != stored_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

void DeadLetterQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_.clear();
    spdlog::info("[DLQ] Buffer cleared (total dropped remains: {})",
                 total_dropped_.load(std::memory_order_relaxed));
}

} // namespace BatchStore
