#include <progressengine/core/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace ProgressEngine {

ThreadPool::ThreadPool(size_t numThreads) : isRunning(true) {
    if (numThreads == 0) numThreads = 1;
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
    spdlog::debug("[ThreadPool] Started {} workers", numThreads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load(std::memory_order_acquire)) {
            spdlog::warn("[ThreadPool] Task rejected, pool is shut down");
            return false;
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
    return true;
}

size_t ThreadPool::getPendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return tasks.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.exchange(false, std::memory_order_acq_rel) && workers.empty()) {
            return;
        }
    }
    condition.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
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
            // Drain remaining work before exiting
            if (tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool] Task threw: {}", e.what());
        } catch (...) {
            spdlog::error("[ThreadPool] Task threw a non-standard exception");
        }
    }
}

} // namespace ProgressEngine
