
#include "check_validator.hpp"
#include <fmt/format.h>

namespace {

bool is_supported_method(const std::string& method) {
    return method == "get" || method == "post" || method == "put" || method == "delete";
}

} // namespace

Status validate_check(const Check& check, int max_timeout_seconds) {
    if (check.id.empty()) {
        return Status::failure(ErrorKind::Validation, "missing id");
    }

    if (check.protocol != "http" && check.protocol != "https") {
        return Status::failure(ErrorKind::Validation,
                               fmt::format("check {}: unsupported protocol '{}'", check.id, check.protocol));
    }

    if (check.host.empty()) {
        return Status::failure(ErrorKind::Validation, fmt::format("check {}: missing host", check.id));
    }

    if (!check.path.empty() && check.path.front() != '/') {
        return Status::failure(ErrorKind::Validation,
                               fmt::format("check {}: path '{}' must start with '/'", check.id, check.path));
    }

    if (!is_supported_method(check.method)) {
        return Status::failure(ErrorKind::Validation,
                               fmt::format("check {}: unsupported method '{}'", check.id, check.method));
    }

    if (check.timeout_seconds < 1 || check.timeout_seconds > max_timeout_seconds) {
        return Status::failure(ErrorKind::Validation,
                               fmt::format("check {}: timeout {}s outside 1..{}s",
                                           check.id, check.timeout_seconds, max_timeout_seconds));
    }

    if (check.success_codes.empty()) {
        return Status::failure(ErrorKind::Validation, fmt::format("check {}: no success codes", check.id));
    }

    for (int code : check.success_codes) {
        if (code < 100 || code > 599) {
            return Status::failure(ErrorKind::Validation,
                                   fmt::format("check {}: invalid success code {}", check.id, code));
        }
    }

    if (check.last_checked && *check.last_checked < 0) {
        return Status::failure(ErrorKind::Validation, fmt::format("check {}: negative last_checked", check.id));
    }

    return Status::success();
}
