
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Runs a task on its own thread every period until stopped.
// A tick never waits for work the task handed off elsewhere.
class PeriodicTimer {
public:
    PeriodicTimer(std::string name, std::chrono::milliseconds period, std::function<void()> task);
    ~PeriodicTimer();

    void start(bool run_immediately);
    void stop();

    bool is_running() const { return running_; }
    uint64_t ticks() const { return ticks_; }

    // Non-copyable
    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

private:
    void run(bool run_immediately);
    void fire();

    std::string name_;
    std::chrono::milliseconds period_;
    std::function<void()> task_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};
