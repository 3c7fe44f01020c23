
#pragma once
#include <string>

class Config {
public:
    // Service info
    std::string service_name = "uptime_worker";
    std::string log_level = "info";

    // Check registry (Redis)
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string check_key_prefix = "uptime:check:";
    std::string check_index_key = "uptime:checks";

    // Log store (PostgreSQL)
    std::string pg_dsn;

    // SMS delivery (Twilio); empty credentials disable delivery
    std::string twilio_api_url = "https://api.twilio.com/2010-04-01";
    std::string twilio_account_sid;
    std::string twilio_auth_token;
    std::string twilio_from_phone;
    std::string sms_country_code = "+1";
    int sms_timeout_seconds = 10;

    // Timing
    int check_interval_seconds = 60;
    int log_rotation_interval_seconds = 60 * 60 * 24;
    int max_check_timeout_seconds = 5;
    bool run_on_start = true;

    // Worker pool
    int worker_threads = 8;

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    static Config from_env();
    void validate() const;

    bool sms_enabled() const;
};
