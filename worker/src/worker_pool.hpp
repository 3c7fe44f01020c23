
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed set of threads draining a FIFO task queue
class WorkerPool {
public:
    explicit WorkerPool(size_t thread_count);
    ~WorkerPool();

    // Returns false once the pool is shutting down
    bool submit(std::function<void()> task);

    // Blocks until the queue is empty and no task is running
    void wait_idle();

    // Runs the remaining queued tasks, then joins the threads
    void shutdown();

    size_t size() const { return threads_.size(); }
    size_t pending() const;

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    bool stopping_ = false;
};
