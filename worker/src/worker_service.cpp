#include "worker_service.hpp"
#include "health.hpp"
#include "http_transport.hpp"
#include "outcome_processor.hpp"
#include "periodic_timer.hpp"
#include "postgres_log_store.hpp"
#include "probe_executor.hpp"
#include "redis_check_registry.hpp"
#include "sms_client.hpp"
#include "util.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

WorkerService::WorkerService(const Config& config) : config_(config) {
    registry_ = std::make_unique<RedisCheckRegistry>(config_);

    log_store_ = std::make_unique<PostgresLogStore>(config_);
    if (!log_store_->initialize_schema()) {
        spdlog::warn("Failed to initialize log store schema");
    }

    sms_client_ = std::make_unique<SmsClient>(config_);
    transport_ = std::make_unique<HttpTransport>();
    worker_pool_ = std::make_unique<WorkerPool>(static_cast<size_t>(config_.worker_threads));

    probe_executor_ = std::make_unique<ProbeExecutor>(*transport_);
    outcome_processor_ = std::make_unique<OutcomeProcessor>(*registry_, *log_store_, *sms_client_);
    scheduler_ = std::make_unique<CheckScheduler>(
        *registry_, *probe_executor_, *outcome_processor_, *worker_pool_, config_.max_check_timeout_seconds);
    log_rotator_ = std::make_unique<LogRotator>(*log_store_);

    check_timer_ = std::make_unique<PeriodicTimer>(
        "check-cycle", std::chrono::seconds(config_.check_interval_seconds), [this]() { run_check_cycle(); });
    rotation_timer_ = std::make_unique<PeriodicTimer>(
        "log-rotation", std::chrono::seconds(config_.log_rotation_interval_seconds), [this]() { run_log_rotation(); });

    health_server_ = std::make_unique<HealthServer>(config_, [this]() { return health_status(); });
}

WorkerService::~WorkerService() {
    stop();
}

void WorkerService::run() {
    if (running_.exchange(true)) {
        spdlog::warn("Worker service is already running");
        return;
    }

    check_timer_->start(config_.run_on_start);
    rotation_timer_->start(config_.run_on_start);
    health_server_->start();

    spdlog::info("Background workers are running: checks every {}s, log rotation every {}s",
                 config_.check_interval_seconds, config_.log_rotation_interval_seconds);
}

void WorkerService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("Stopping worker service...");
    check_timer_->stop();
    rotation_timer_->stop();
    health_server_->stop();

    // Runs every probe still queued before joining. The queue holds at most
    // one probe per check and each probe is bounded by its own timeout.
    worker_pool_->shutdown();
    spdlog::info("Worker service stopped.");
}

void WorkerService::run_check_cycle() {
    CycleReport report = scheduler_->run_cycle();

    std::lock_guard<std::mutex> lock(report_mutex_);
    last_cycle_ = report;
    last_cycle_at_ = util::current_iso8601();
}

void WorkerService::run_log_rotation() {
    RotationReport report = log_rotator_->rotate();

    std::lock_guard<std::mutex> lock(report_mutex_);
    last_rotation_ = report;
    last_rotation_at_ = util::current_iso8601();
}

nlohmann::json WorkerService::health_status() {
    bool registry_ok = registry_->check_health();
    bool log_store_ok = log_store_->check_health();

    nlohmann::json status;
    status["status"] = registry_ok && log_store_ok ? "healthy" : "unhealthy";
    status["timestamp"] = util::current_iso8601();
    status["components"]["registry"] = registry_ok ? "healthy" : "unhealthy";
    status["components"]["log_store"] = log_store_ok ? "healthy" : "unhealthy";
    status["components"]["sms"] = config_.sms_enabled() ? "configured" : "disabled";
    status["worker_pool"]["threads"] = worker_pool_->size();
    status["worker_pool"]["pending"] = worker_pool_->pending();

    std::lock_guard<std::mutex> lock(report_mutex_);
    status["last_check_cycle"] = {
        {"at", last_cycle_at_},
        {"ok", last_cycle_.status.ok()},
        {"listed", last_cycle_.listed},
        {"dispatched", last_cycle_.dispatched},
        {"skipped", last_cycle_.skipped},
        {"already_queued", last_cycle_.already_queued},
        {"backlog", last_cycle_.backlog}
    };
    status["last_log_rotation"] = {
        {"at", last_rotation_at_},
        {"ok", last_rotation_.status.ok()},
        {"streams", last_rotation_.streams},
        {"rotated", last_rotation_.rotated},
        {"failed", last_rotation_.failed}
    };
    return status;
}
