
#include "sms_client.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace {

bool all_digits(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

SmsClient::SmsClient(const Config& config) : config_(config) {}

std::optional<std::string> SmsClient::normalize_phone(const std::string& phone, const std::string& country_code) {
    std::string trimmed = util::trim(phone);

    if (trimmed.size() == 10 && all_digits(trimmed)) {
        return country_code + trimmed;
    }

    if (trimmed.size() > 1 && trimmed.front() == '+') {
        std::string digits = trimmed.substr(1);
        if (digits.size() >= 8 && digits.size() <= 15 && all_digits(digits)) {
            return trimmed;
        }
    }

    return std::nullopt;
}

Status SmsClient::send(const std::string& address, const std::string& message) {
    if (!config_.sms_enabled()) {
        return Status::failure(ErrorKind::Delivery, "SMS delivery is not configured");
    }

    auto to = normalize_phone(address, config_.sms_country_code);
    if (!to) {
        return Status::failure(ErrorKind::Delivery, fmt::format("invalid phone number '{}'", address));
    }

    std::string body = util::trim(message);
    if (body.empty() || body.size() > kMaxMessageLength) {
        return Status::failure(ErrorKind::Delivery,
                               fmt::format("message length {} outside 1..{}", body.size(), kMaxMessageLength));
    }

    const std::string url = fmt::format("{}/Accounts/{}/Messages.json",
                                        config_.twilio_api_url, config_.twilio_account_sid);

    try {
        cpr::Response response = cpr::Post(
            cpr::Url{url},
            cpr::Authentication{config_.twilio_account_sid, config_.twilio_auth_token, cpr::AuthMode::BASIC},
            cpr::Payload{{"From", config_.twilio_from_phone}, {"To", *to}, {"Body", body}},
            cpr::Timeout{std::chrono::seconds(config_.sms_timeout_seconds)}
        );

        if (response.error) {
            return Status::failure(ErrorKind::Delivery, response.error.message);
        }

        if (response.status_code == 200 || response.status_code == 201) {
            spdlog::debug("SMS accepted by Twilio for {}", *to);
            return Status::success();
        }

        std::string detail = response.text;
        auto json = nlohmann::json::parse(response.text, nullptr, false);
        if (!json.is_discarded() && json.is_object()) {
            detail = json.value("message", detail);
        }
        return Status::failure(ErrorKind::Delivery,
                               fmt::format("Twilio returned status {}: {}", response.status_code, detail));
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::Delivery, e.what());
    }
}
