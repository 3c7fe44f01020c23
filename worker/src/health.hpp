
#pragma once
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>

class HealthServer {
public:
    // Must return an object with a "status" field of "healthy" or "unhealthy"
    using StatusProvider = std::function<nlohmann::json()>;

    HealthServer(const Config& config, StatusProvider provider);
    ~HealthServer();

    void start();
    void stop();
    bool is_running() const;

    // Non-copyable
    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
