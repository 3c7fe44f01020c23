
#pragma once

#include "config.hpp"
#include "log_store.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>

// Outcome log streams kept in PostgreSQL. Active records live in check_log;
// rotation folds them into one check_log_archive row per archive id.
class PostgresLogStore : public LogStore {
public:
    explicit PostgresLogStore(const Config& config);
    ~PostgresLogStore();

    bool initialize_schema();
    bool check_health();

    Status append(const std::string& stream_id, const std::string& record) override;
    Result<std::vector<std::string>> list_active_streams() override;
    Status compress(const std::string& stream_id, const std::string& archive_id) override;

    // Removes only records covered by the stream's latest archive
    Status truncate(const std::string& stream_id) override;

    // Non-copyable
    PostgresLogStore(const PostgresLogStore&) = delete;
    PostgresLogStore& operator=(const PostgresLogStore&) = delete;

private:
    bool connect();
    bool ensure_connection();

    Config config_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex conn_mutex_;
};
