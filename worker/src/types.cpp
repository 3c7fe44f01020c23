
#include "types.hpp"
#include <algorithm>

std::string to_string(CheckState state) {
    switch (state) {
        case CheckState::Up: return "up";
        case CheckState::Down: return "down";
        case CheckState::Unset: break;
    }
    return "";
}

CheckState check_state_from_string(const std::string& value) {
    if (value == "up") return CheckState::Up;
    if (value == "down") return CheckState::Down;
    return CheckState::Unset;
}

std::string Check::url() const {
    return protocol + "://" + host + path;
}

bool Check::accepts(int response_code) const {
    return std::find(success_codes.begin(), success_codes.end(), response_code) != success_codes.end();
}

nlohmann::json Check::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"protocol", protocol},
        {"host", host},
        {"path", path},
        {"method", method},
        {"timeout_seconds", timeout_seconds},
        {"success_codes", success_codes},
        {"state", state == CheckState::Unset ? nlohmann::json(nullptr) : nlohmann::json(to_string(state))},
        {"last_checked", last_checked ? nlohmann::json(*last_checked) : nlohmann::json(nullptr)},
        {"user_phone", user_phone}
    };
    return j;
}

std::string to_string(ProbeErrorKind kind) {
    return kind == ProbeErrorKind::Timeout ? "timeout" : "connection";
}

ProbeError ProbeError::connection(std::string detail) {
    return ProbeError{ProbeErrorKind::Connection, std::move(detail)};
}

ProbeError ProbeError::timeout() {
    return ProbeError{ProbeErrorKind::Timeout, "timeout"};
}

nlohmann::json ProbeOutcome::to_json() const {
    nlohmann::json j;
    if (error) {
        j["error"] = {
            {"kind", to_string(error->kind)},
            {"value", error->detail}
        };
    } else {
        j["error"] = nullptr;
    }
    j["response_code"] = response_code ? nlohmann::json(*response_code) : nlohmann::json(nullptr);
    j["sent"] = sent;
    return j;
}

nlohmann::json LogRecord::to_json() const {
    return {
        {"check", check.to_json()},
        {"outcome", outcome.to_json()},
        {"state", to_string(state)},
        {"alert", alert},
        {"time", time}
    };
}
