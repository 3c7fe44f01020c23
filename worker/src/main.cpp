#include "config.hpp"
#include "util.hpp"
#include "worker_service.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

// Set from the signal handler, polled by main
std::atomic<bool> g_terminate_flag(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
    }
}

int main() {
    util::setup_logging("uptime_worker", "info");

    std::unique_ptr<WorkerService> service;
    try {
        // 1. Load configuration
        Config config = Config::from_env();
        util::setup_logging(config.service_name, config.log_level);
        config.validate();
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        // 2. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 3. Create and run the service
        service = std::make_unique<WorkerService>(config);
        service->run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error during initialization: {}", e.what());
        return 1;
    }

    while (!g_terminate_flag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Termination signal received. Shutting down...");
    service->stop();

    spdlog::info("Uptime worker has shut down gracefully.");
    spdlog::shutdown();
    return 0;
}
