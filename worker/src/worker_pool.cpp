
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>

WorkerPool::WorkerPool(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
    spdlog::debug("Worker pool started with {} threads", thread_count);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("Worker pool stopped");
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                // stopping and drained
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}
