#pragma once

#include "config.hpp"
#include "check_scheduler.hpp"
#include "log_rotator.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Forward declarations for components
class RedisCheckRegistry;
class PostgresLogStore;
class SmsClient;
class HttpTransport;
class PeriodicTimer;
class HealthServer;

class WorkerService {
public:
    explicit WorkerService(const Config& config);
    ~WorkerService();

    void run();
    void stop();

private:
    void run_check_cycle();
    void run_log_rotation();
    nlohmann::json health_status();

    Config config_;
    std::atomic<bool> running_{false};

    std::unique_ptr<RedisCheckRegistry> registry_;
    std::unique_ptr<PostgresLogStore> log_store_;
    std::unique_ptr<SmsClient> sms_client_;
    std::unique_ptr<HttpTransport> transport_;
    std::unique_ptr<WorkerPool> worker_pool_;
    std::unique_ptr<ProbeExecutor> probe_executor_;
    std::unique_ptr<OutcomeProcessor> outcome_processor_;
    std::unique_ptr<CheckScheduler> scheduler_;
    std::unique_ptr<LogRotator> log_rotator_;
    std::unique_ptr<PeriodicTimer> check_timer_;
    std::unique_ptr<PeriodicTimer> rotation_timer_;
    std::unique_ptr<HealthServer> health_server_;

    std::mutex report_mutex_;
    CycleReport last_cycle_;
    RotationReport last_rotation_;
    std::string last_cycle_at_;
    std::string last_rotation_at_;
};
