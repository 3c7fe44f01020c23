
#include "periodic_timer.hpp"
#include <spdlog/spdlog.h>

PeriodicTimer::PeriodicTimer(std::string name, std::chrono::milliseconds period, std::function<void()> task)
    : name_(std::move(name)), period_(period), task_(std::move(task)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
}

void PeriodicTimer::start(bool run_immediately) {
    if (running_.exchange(true)) {
        spdlog::warn("Timer '{}' already running", name_);
        return;
    }
    thread_ = std::thread(&PeriodicTimer::run, this, run_immediately);
    spdlog::info("Timer '{}' started, period {} ms", name_, period_.count());
}

void PeriodicTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("Timer '{}' stopped", name_);
}

void PeriodicTimer::run(bool run_immediately) {
    if (run_immediately) {
        fire();
    }

    auto next = std::chrono::steady_clock::now() + period_;
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, next, [this] { return !running_; })) {
                break;
            }
        }
        fire();
        next += period_;
        // Skip missed ticks instead of firing them back to back
        auto now = std::chrono::steady_clock::now();
        if (next < now) {
            next = now + period_;
        }
    }
}

void PeriodicTimer::fire() {
    ++ticks_;
    try {
        task_();
    } catch (const std::exception& e) {
        spdlog::error("Timer '{}' task failed: {}", name_, e.what());
    }
}
