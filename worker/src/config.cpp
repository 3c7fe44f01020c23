
#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

using util::get_env_var;
using util::get_env_int;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = get_env_var("LOG_LEVEL", config.log_level);

    // Registry
    config.redis_url = get_env_var("REDIS_URL", config.redis_url);
    config.check_key_prefix = get_env_var("CHECK_KEY_PREFIX", config.check_key_prefix);
    config.check_index_key = get_env_var("CHECK_INDEX_KEY", config.check_index_key);

    // Log store
    config.pg_dsn = util::get_required_env_var("PG_DSN");

    // SMS
    config.twilio_api_url = get_env_var("TWILIO_API_URL", config.twilio_api_url);
    config.twilio_account_sid = get_env_var("TWILIO_ACCOUNT_SID");
    config.twilio_auth_token = get_env_var("TWILIO_AUTH_TOKEN");
    config.twilio_from_phone = get_env_var("TWILIO_FROM_PHONE");
    config.sms_country_code = get_env_var("SMS_COUNTRY_CODE", config.sms_country_code);
    config.sms_timeout_seconds = get_env_int("SMS_TIMEOUT_SECONDS", config.sms_timeout_seconds);

    // Timing
    config.check_interval_seconds = get_env_int("CHECK_INTERVAL_SECONDS", config.check_interval_seconds);
    config.log_rotation_interval_seconds =
        get_env_int("LOG_ROTATION_INTERVAL_SECONDS", config.log_rotation_interval_seconds);
    config.max_check_timeout_seconds = get_env_int("MAX_CHECK_TIMEOUT_SECONDS", config.max_check_timeout_seconds);
    config.run_on_start = util::get_env_bool("RUN_ON_START", config.run_on_start);

    config.worker_threads = get_env_int("WORKER_THREADS", config.worker_threads);

    // Health
    config.health_host = get_env_var("HEALTH_HOST", config.health_host);
    config.health_port = get_env_int("HEALTH_PORT", config.health_port);

    return config;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }

    if (redis_url.empty()) {
        throw std::runtime_error("REDIS_URL cannot be empty");
    }

    if (check_interval_seconds < 1) {
        throw std::runtime_error("CHECK_INTERVAL_SECONDS must be at least 1");
    }

    if (log_rotation_interval_seconds < 1) {
        throw std::runtime_error("LOG_ROTATION_INTERVAL_SECONDS must be at least 1");
    }

    if (max_check_timeout_seconds < 1) {
        throw std::runtime_error("MAX_CHECK_TIMEOUT_SECONDS must be at least 1");
    }

    if (worker_threads < 1 || worker_threads > 256) {
        throw std::runtime_error("WORKER_THREADS must be between 1 and 256");
    }

    if (sms_timeout_seconds < 1) {
        throw std::runtime_error("SMS_TIMEOUT_SECONDS must be at least 1");
    }

    if (health_port <= 0 || health_port > 65535) {
        throw std::runtime_error("HEALTH_PORT must be between 1 and 65535");
    }

    if (log_rotation_interval_seconds <= check_interval_seconds) {
        spdlog::warn("Log rotation interval ({}s) is not longer than the check interval ({}s)",
                     log_rotation_interval_seconds, check_interval_seconds);
    }

    if (!sms_enabled()) {
        spdlog::warn("Twilio credentials not set, state change alerts will not be delivered");
    }

    spdlog::info("Configuration validated successfully");
}

bool Config::sms_enabled() const {
    return !twilio_account_sid.empty() && !twilio_auth_token.empty() && !twilio_from_phone.empty();
}
