#include <batchstore/core/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace BatchStore {

ThreadPool::ThreadPool(size_t numThreads) : isRunning(true) {
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load(std::memory_order_acquire)) {
            return false;
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        isRunning.store(false, std::memory_order_release);
    }
    condition.notify_all();
    for (auto& w : workers) {
        if (w.joinable()) {
            w.join();
        }
    }
    workers.clear();
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this] {
                return !isRunning.load(std::memory_order_acquire) || !tasks.empty();
            });
            if (tasks.empty()) {
                return;     // stopped and drained
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool] Task failed: {}", e.what());
        }
    }
}

} // namespace BatchStore
