
#include "health.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class HealthServer::Impl {
public:
    Impl(const Config& config, StatusProvider provider)
        : config_(config), provider_(std::move(provider)), running_(false) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Health server already running");
            return;
        }

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            try {
                health_status = provider_();
            } catch (const std::exception& e) {
                health_status = {{"status", "unhealthy"}, {"error", e.what()}};
            }
            health_status["service"] = config_.service_name;

            res.status = health_status.value("status", "unhealthy") == "healthy" ? 200 : 503;
            res.set_content(health_status.dump(2), "application/json");
        });

        server_.Get("/ready", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json ready = {{"status", "ready"}, {"service", config_.service_name}};
            res.set_content(ready.dump(), "application/json");
        });

        if (!server_.bind_to_port(config_.health_host.c_str(), config_.health_port)) {
            spdlog::error("Failed to bind health server to {}:{}", config_.health_host, config_.health_port);
            return;
        }

        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server listening on {}:{}", config_.health_host, config_.health_port);
            server_.listen_after_bind();
        });
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Health check server stopped");
    }

    bool is_running() const {
        return running_;
    }

private:
    Config config_;
    StatusProvider provider_;
    httplib::Server server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, StatusProvider provider)
    : pImpl_(std::make_unique<Impl>(config, std::move(provider))) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}

bool HealthServer::is_running() const {
    return pImpl_->is_running();
}
