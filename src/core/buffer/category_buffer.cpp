#include <batchstore/core/buffer/category_buffer.hpp>
#include <algorithm>
#include <iterator>

namespace BatchStore {

CategoryBuffer::CategoryBuffer(Category category, size_t max_buffer_size)
    : category_(category), max_buffer_size_(max_buffer_size) {}

EnqueueStatus CategoryBuffer::enqueue(WriteRecord&& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return EnqueueStatus::CLOSED;
    }
    if (records_.size() + reserved_ >= max_buffer_size_) {
        return EnqueueStatus::FULL;
    }
    records_.push_back(std::move(record));
    return EnqueueStatus::ACCEPTED;
}

std::vector<WriteRecord> CategoryBuffer::takeAll() {
    std::deque<WriteRecord> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(records_);
        reserved_ += taken.size();
    }
    // Conversion happens outside the lock
    return std::vector<WriteRecord>(std::make_move_iterator(taken.begin()),
                                    std::make_move_iterator(taken.end()));
}

std::vector<WriteRecord> CategoryBuffer::take(size_t max_count) {
    std::vector<WriteRecord> taken;
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = std::min(max_count, records_.size());
    taken.reserve(count);
    auto end = records_.begin() + static_cast<std::ptrdiff_t>(count);
    taken.insert(taken.end(), std::make_move_iterator(records_.begin()),
                 std::make_move_iterator(end));
    records_.erase(records_.begin(), end);
    reserved_ += count;
    return taken;
}

void CategoryBuffer::release(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_ -= std::min(count, reserved_);
}

void CategoryBuffer::requeueFront(std::vector<WriteRecord>&& records) {
    if (records.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    reserved_ -= std::min(records.size(), reserved_);
    records_.insert(records_.begin(), std::make_move_iterator(records.begin()),
                    std::make_move_iterator(records.end()));
    records.clear();
}

void CategoryBuffer::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool CategoryBuffer::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t CategoryBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t CategoryBuffer::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

bool CategoryBuffer::isFull() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size() + reserved_ >= max_buffer_size_;
}

} // namespace BatchStore
