
#pragma once
#include "probe_transport.hpp"
#include "types.hpp"
#include <atomic>
#include <functional>

// One-shot latch; the first try_complete() wins, later calls return false
class ProbeCompletion {
public:
    bool try_complete() { return !completed_.exchange(true); }
    bool completed() const { return completed_.load(); }

private:
    std::atomic<bool> completed_{false};
};

class ProbeExecutor {
public:
    using Continuation = std::function<void(const Check& check, ProbeOutcome& outcome)>;

    explicit ProbeExecutor(ProbeTransport& transport);

    // Probes the check once and hands the outcome to on_complete exactly once.
    // Never throws.
    void execute(const Check& check, const Continuation& on_complete);

    static ProbeRequest build_request(const Check& check);

private:
    ProbeTransport& transport_;
};
