
#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class CheckState {
    Unset,
    Up,
    Down
};

std::string to_string(CheckState state);
CheckState check_state_from_string(const std::string& value);

// A monitored endpoint as stored in the registry
struct Check {
    std::string id;
    std::string protocol;  // "http" or "https"
    std::string host;
    std::string path;
    std::string method;    // lower case
    int timeout_seconds = 0;
    std::vector<int> success_codes;

    CheckState state = CheckState::Unset;
    std::optional<int64_t> last_checked; // epoch millis
    std::string user_phone;

    std::string url() const;
    bool accepts(int response_code) const;

    nlohmann::json to_json() const;
};

enum class ProbeErrorKind {
    Connection,
    Timeout
};

std::string to_string(ProbeErrorKind kind);

struct ProbeError {
    ProbeErrorKind kind = ProbeErrorKind::Connection;
    std::string detail;

    static ProbeError connection(std::string detail);
    static ProbeError timeout();
};

struct ProbeOutcome {
    std::optional<ProbeError> error;
    std::optional<int> response_code;
    bool sent = false;

    bool completed() const { return error.has_value() != response_code.has_value(); }

    nlohmann::json to_json() const;
};

// Audit entry appended to the check's log stream once per processed probe
struct LogRecord {
    Check check;
    ProbeOutcome outcome;
    CheckState state = CheckState::Unset;
    bool alert = false;
    int64_t time = 0;

    nlohmann::json to_json() const;
};
