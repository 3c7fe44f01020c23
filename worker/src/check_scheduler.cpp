
#include "check_scheduler.hpp"
#include "check_validator.hpp"
#include <spdlog/spdlog.h>

CheckScheduler::CheckScheduler(CheckRegistry& registry,
                               ProbeExecutor& executor,
                               OutcomeProcessor& processor,
                               WorkerPool& pool,
                               int max_timeout_seconds)
    : registry_(registry),
      executor_(executor),
      processor_(processor),
      pool_(pool),
      max_timeout_seconds_(max_timeout_seconds) {}

CycleReport CheckScheduler::run_cycle() {
    CycleReport report;

    auto listed = registry_.list_checks();
    if (!listed.ok()) {
        spdlog::error("Error reading checks from the registry: {}", listed.status.message);
        report.status = listed.status;
        return report;
    }

    report.listed = listed.value.size();
    for (const auto& check : listed.value) {
        Status valid = validate_check(check, max_timeout_seconds_);
        if (!valid.ok()) {
            spdlog::warn("Skipping malformed check: {}", valid.message);
            ++report.skipped;
            continue;
        }
        switch (dispatch(check)) {
            case Dispatch::Queued:
                ++report.dispatched;
                break;
            case Dispatch::AlreadyQueued:
                ++report.already_queued;
                break;
            case Dispatch::Refused:
                ++report.skipped;
                break;
        }
    }

    report.backlog = pool_.pending();
    if (report.already_queued > 0) {
        spdlog::warn("{} checks still queued from an earlier cycle, probes are falling behind (backlog {})",
                     report.already_queued, report.backlog);
    }
    spdlog::info("Check cycle dispatched {} of {} checks ({} skipped, {} already queued)",
                 report.dispatched, report.listed, report.skipped, report.already_queued);
    return report;
}

CheckScheduler::Dispatch CheckScheduler::dispatch(const Check& check) {
    {
        std::lock_guard<std::mutex> lock(queued_mutex_);
        if (!queued_ids_.insert(check.id).second) {
            spdlog::debug("Check {} is still waiting for a worker, not queued again", check.id);
            return Dispatch::AlreadyQueued;
        }
    }

    bool queued = pool_.submit([this, check]() {
        mark_started(check.id);
        executor_.execute(check, [this](const Check& probed, ProbeOutcome& outcome) {
            processor_.process(probed, outcome);
        });
    });

    if (!queued) {
        mark_started(check.id);
        spdlog::warn("Worker pool is shutting down, check {} not probed this cycle", check.id);
        return Dispatch::Refused;
    }
    return Dispatch::Queued;
}

void CheckScheduler::mark_started(const std::string& check_id) {
    std::lock_guard<std::mutex> lock(queued_mutex_);
    queued_ids_.erase(check_id);
}
