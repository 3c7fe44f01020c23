
#pragma once
#include "config.hpp"
#include "notification_channel.hpp"
#include <optional>
#include <string>

// Delivers alerts as SMS through the Twilio Messages API
class SmsClient : public NotificationChannel {
public:
    static constexpr size_t kMaxMessageLength = 1600;

    explicit SmsClient(const Config& config);

    Status send(const std::string& address, const std::string& message) override;

    // Accepts a bare 10-digit number (prefixed with country_code) or an
    // E.164 number; returns nullopt for anything else.
    static std::optional<std::string> normalize_phone(const std::string& phone, const std::string& country_code);

private:
    Config config_;
};
