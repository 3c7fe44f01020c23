
#pragma once
#include "check_registry.hpp"
#include "outcome_processor.hpp"
#include "probe_executor.hpp"
#include "status.hpp"
#include "worker_pool.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

struct CycleReport {
    Status status;
    size_t listed = 0;
    size_t dispatched = 0;
    size_t skipped = 0;
    size_t already_queued = 0; // still waiting from an earlier cycle
    size_t backlog = 0;        // pool queue length after dispatch
};

// Lists every registered check and hands each valid one to the worker pool.
// Returns as soon as the probes are queued; it does not wait for them.
// A check is queued at most once; if its previous probe has not started yet
// the cycle skips it, so the queue never holds more than one entry per check.
class CheckScheduler {
public:
    CheckScheduler(CheckRegistry& registry,
                   ProbeExecutor& executor,
                   OutcomeProcessor& processor,
                   WorkerPool& pool,
                   int max_timeout_seconds);

    CycleReport run_cycle();

private:
    enum class Dispatch { Queued, AlreadyQueued, Refused };

    Dispatch dispatch(const Check& check);
    void mark_started(const std::string& check_id);

    CheckRegistry& registry_;
    ProbeExecutor& executor_;
    OutcomeProcessor& processor_;
    WorkerPool& pool_;
    int max_timeout_seconds_;

    std::mutex queued_mutex_;
    std::unordered_set<std::string> queued_ids_;
};
