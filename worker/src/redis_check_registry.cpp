
#include "redis_check_registry.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iterator>
#include <limits>
#include <optional>
#include <unordered_set>

namespace {

// Only the runtime fields are touched, and only while the check still exists
const char* kWriteRuntimeFields = R"(
if redis.call('EXISTS', KEYS[1]) == 0 then
    return 0
end
redis.call('HSET', KEYS[1], 'state', ARGV[1], 'last_checked', ARGV[2])
return 1
)";

std::string field_or_empty(const std::unordered_map<std::string, std::string>& fields, const std::string& name) {
    auto it = fields.find(name);
    return it == fields.end() ? std::string() : it->second;
}

// Whole-string integer parse; "5s" and out of range values are rejected
template <typename T>
std::optional<T> parse_whole(const std::string& raw) {
    std::string trimmed = util::trim(raw);
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(trimmed, &consumed);
        if (consumed != trimmed.size() ||
            parsed < std::numeric_limits<T>::min() || parsed > std::numeric_limits<T>::max()) {
            return std::nullopt;
        }
        return static_cast<T>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int> json_status_code(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto code = value.get<uint64_t>();
        if (code > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(code);
    }
    if (value.is_number_integer()) {
        auto code = value.get<int64_t>();
        if (code < std::numeric_limits<int>::min() || code > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(code);
    }
    return std::nullopt;
}

std::vector<int> parse_success_codes(const std::string& raw) {
    std::vector<int> codes;
    auto json = nlohmann::json::parse(raw, nullptr, false);
    if (!json.is_discarded()) {
        if (json.is_array()) {
            for (const auto& value : json) {
                auto code = json_status_code(value);
                if (!code) {
                    return {};
                }
                codes.push_back(*code);
            }
        } else if (auto code = json_status_code(json)) {
            codes.push_back(*code);
        }
        return codes;
    }

    // Also accept "200,201"
    for (const auto& token : util::split_string(raw, ',')) {
        auto code = parse_whole<int>(token);
        if (!code) {
            return {};
        }
        codes.push_back(*code);
    }
    return codes;
}

} // namespace

RedisCheckRegistry::RedisCheckRegistry(const Config& config) : config_(config) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

std::string RedisCheckRegistry::key_for(const std::string& id) const {
    return config_.check_key_prefix + id;
}

bool RedisCheckRegistry::check_health() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Redis health check failed: {}", e.what());
        return false;
    }
}

Check RedisCheckRegistry::decode(const std::string& id, const std::unordered_map<std::string, std::string>& fields) {
    Check check;
    check.id = id;
    check.protocol = util::to_lower(field_or_empty(fields, "protocol"));
    check.host = field_or_empty(fields, "host");
    check.path = field_or_empty(fields, "path");
    check.method = util::to_lower(field_or_empty(fields, "method"));
    check.user_phone = field_or_empty(fields, "user_phone");
    check.state = check_state_from_string(field_or_empty(fields, "state"));
    check.success_codes = parse_success_codes(field_or_empty(fields, "success_codes"));

    // Zero fails validation, so an unreadable timeout skips the check
    check.timeout_seconds = parse_whole<int>(field_or_empty(fields, "timeout_seconds")).value_or(0);

    std::string last_checked = field_or_empty(fields, "last_checked");
    if (!last_checked.empty()) {
        check.last_checked = parse_whole<int64_t>(last_checked);
        if (!check.last_checked) {
            spdlog::warn("Check {} has an unreadable last_checked '{}', treating as never checked", id, last_checked);
        }
    }

    return check;
}

Result<std::vector<Check>> RedisCheckRegistry::list_checks() {
    std::unordered_set<std::string> ids;
    try {
        redis_->smembers(config_.check_index_key, std::inserter(ids, ids.begin()));
    } catch (const std::exception& e) {
        return Result<std::vector<Check>>::failure(
            ErrorKind::Read, fmt::format("failed to list check ids: {}", e.what()));
    }

    std::vector<Check> checks;
    checks.reserve(ids.size());
    for (const auto& id : ids) {
        std::unordered_map<std::string, std::string> fields;
        try {
            redis_->hgetall(key_for(id), std::inserter(fields, fields.begin()));
        } catch (const std::exception& e) {
            spdlog::error("Error reading check {}: {}", id, e.what());
            continue;
        }

        if (fields.empty()) {
            spdlog::warn("Check {} is indexed but has no data, skipping", id);
            continue;
        }
        checks.push_back(decode(id, fields));
    }

    return Result<std::vector<Check>>::success(std::move(checks));
}

Status RedisCheckRegistry::write_check(const Check& check) {
    const std::string state = to_string(check.state);
    const std::string last_checked = check.last_checked ? std::to_string(*check.last_checked) : std::string();

    try {
        auto written = redis_->eval<long long>(kWriteRuntimeFields, {key_for(check.id)}, {state, last_checked});
        if (written == 0) {
            return Status::failure(ErrorKind::Persistence,
                                   fmt::format("check {} no longer exists", check.id));
        }
        return Status::success();
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::Persistence, e.what());
    }
}
