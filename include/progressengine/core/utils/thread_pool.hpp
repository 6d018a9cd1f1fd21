#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace ProgressEngine {

/**
 * @brief Fixed-size worker pool for fire-and-forget side work (audit dispatch).
 *
 * shutdown() stops accepting tasks, drains what is already queued and joins
 * the workers. Tasks submitted after shutdown are dropped with a warning.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false if the pool is shut down
    bool submit(std::function<void()> task);

    size_t getPendingTasks() const;
    size_t size() const { return workers.size(); }

    void shutdown();
private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

} // namespace ProgressEngine
