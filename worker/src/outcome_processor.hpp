
#pragma once
#include "check_registry.hpp"
#include "log_store.hpp"
#include "notification_channel.hpp"
#include "status.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <string>

struct ProcessedOutcome {
    ProbeOutcome outcome;
    CheckState state = CheckState::Unset;
    bool alert_warranted = false;
    bool skipped = false;     // outcome had already been sent
    bool notified = false;

    Status log_status;
    Status persist_status;
    Status notify_status;
};

// Turns a probe outcome into a state update: log, persist, then alert on transitions
class OutcomeProcessor {
public:
    using Clock = std::function<int64_t()>;

    OutcomeProcessor(CheckRegistry& registry,
                     LogStore& log_store,
                     NotificationChannel& notifier,
                     Clock clock = Clock());

    ProcessedOutcome process(const Check& check, ProbeOutcome& outcome);

    static CheckState compute_state(const Check& check, const ProbeOutcome& outcome);
    static bool is_alert_warranted(const Check& check, CheckState new_state);
    static std::string format_alert_message(const Check& check);

private:
    CheckRegistry& registry_;
    LogStore& log_store_;
    NotificationChannel& notifier_;
    Clock clock_;
};
