
#include "probe_executor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ProbeExecutor::ProbeExecutor(ProbeTransport& transport) : transport_(transport) {}

ProbeRequest ProbeExecutor::build_request(const Check& check) {
    ProbeRequest request;
    request.url = check.url();
    request.method = util::to_upper(check.method);
    request.timeout = std::chrono::seconds(check.timeout_seconds);
    return request;
}

void ProbeExecutor::execute(const Check& check, const Continuation& on_complete) {
    ProbeCompletion completion;

    auto deliver = [&check, &on_complete, &completion](ProbeOutcome outcome) {
        if (!completion.try_complete()) {
            spdlog::warn("Dropping duplicate probe signal for check {}", check.id);
            return;
        }
        try {
            on_complete(check, outcome);
        } catch (const std::exception& e) {
            spdlog::error("Outcome handling for check {} failed: {}", check.id, e.what());
        }
    };

    const ProbeRequest request = build_request(check);
    spdlog::debug("Probing check {}: {} {}", check.id, request.method, request.url);

    try {
        transport_.execute(
            request,
            [&deliver](int status_code) {
                ProbeOutcome outcome;
                outcome.response_code = status_code;
                deliver(std::move(outcome));
            },
            [&deliver](const ProbeError& error) {
                ProbeOutcome outcome;
                outcome.error = error;
                deliver(std::move(outcome));
            });
    } catch (const std::exception& e) {
        ProbeOutcome outcome;
        outcome.error = ProbeError::connection(e.what());
        deliver(std::move(outcome));
    }

    if (!completion.completed()) {
        ProbeOutcome outcome;
        outcome.error = ProbeError::connection("transport reported no outcome");
        deliver(std::move(outcome));
    }
}
