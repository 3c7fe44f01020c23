
#include "outcome_processor.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

OutcomeProcessor::OutcomeProcessor(CheckRegistry& registry,
                                   LogStore& log_store,
                                   NotificationChannel& notifier,
                                   Clock clock)
    : registry_(registry),
      log_store_(log_store),
      notifier_(notifier),
      clock_(clock ? std::move(clock) : Clock(util::now_millis)) {}

CheckState OutcomeProcessor::compute_state(const Check& check, const ProbeOutcome& outcome) {
    if (!outcome.error && outcome.response_code && check.accepts(*outcome.response_code)) {
        return CheckState::Up;
    }
    return CheckState::Down;
}

bool OutcomeProcessor::is_alert_warranted(const Check& check, CheckState new_state) {
    // No baseline before the first evaluation
    return check.last_checked.has_value() && check.state != new_state;
}

std::string OutcomeProcessor::format_alert_message(const Check& check) {
    return fmt::format("Alert: Your check for {} {} is currently {}",
                       util::to_upper(check.method), check.url(), to_string(check.state));
}

ProcessedOutcome OutcomeProcessor::process(const Check& check, ProbeOutcome& outcome) {
    ProcessedOutcome result;

    if (outcome.sent) {
        spdlog::debug("Outcome for check {} already processed, ignoring", check.id);
        result.outcome = outcome;
        result.skipped = true;
        return result;
    }

    const CheckState state = compute_state(check, outcome);
    const bool alert_warranted = is_alert_warranted(check, state);
    const int64_t now = clock_();

    result.state = state;
    result.alert_warranted = alert_warranted;

    LogRecord record;
    record.check = check;
    record.outcome = outcome;
    record.state = state;
    record.alert = alert_warranted;
    record.time = now;

    result.log_status = log_store_.append(check.id, record.to_json().dump());
    if (!result.log_status.ok()) {
        spdlog::error("Failed to append log record for check {}: {}", check.id, result.log_status.message);
    } else {
        spdlog::debug("Logged outcome for check {}", check.id);
    }

    Check updated = check;
    updated.state = state;
    updated.last_checked = now;

    result.persist_status = registry_.write_check(updated);
    outcome.sent = true;
    result.outcome = outcome;

    if (!result.persist_status.ok()) {
        spdlog::error("Failed to save updates to check {}: {}", check.id, result.persist_status.message);
        return result;
    }

    if (!alert_warranted) {
        spdlog::debug("Check {} outcome has not changed, no alert needed", check.id);
        return result;
    }

    const std::string message = format_alert_message(updated);
    result.notify_status = notifier_.send(updated.user_phone, message);
    if (result.notify_status.ok()) {
        result.notified = true;
        spdlog::info("Alerted owner of check {} to a status change: {}", check.id, message);
    } else {
        spdlog::error("Could not send alert for check {}: {}", check.id, result.notify_status.message);
    }

    return result;
}
