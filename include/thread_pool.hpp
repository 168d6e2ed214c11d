#pragma once

#include <vector>
#include <queue>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace pixserv {

class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);

    ~ThreadPool();

    // Fire-and-forget; the task must not let exceptions escape.
    // Throws std::runtime_error once the pool is shut down.
    void post(std::function<void()> task);

    // Drains queued tasks and joins the workers. Idempotent.
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> tasks_;

    std::mutex queueMutex_;
    std::condition_variable condition_;

    std::atomic<bool> stop_;
};

} // namespace pixserv
